#include "depotsync/StateStore.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/WorkspaceScanner.hpp"
#include <filesystem>
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;
namespace fs = std::filesystem;

namespace depotsync {

namespace {

struct SyncStateRow {
  int id = 1;
  int64_t lastSynced = 0;
};

struct HaveRow {
  std::string path;
  int64_t changelist = 0;
  std::string digest;
};

constexpr int kStateRowId = 1;

// Helper to deduce the storage type.
inline auto create_state_storage(const std::string &path) {
  return make_storage(
      path,
      make_table<SyncStateRow>(
          "SyncState", make_column("id", &SyncStateRow::id, primary_key()),
          make_column("last_synced", &SyncStateRow::lastSynced)),
      make_table<HaveRow>("HaveList",
                          make_column("path", &HaveRow::path, primary_key()),
                          make_column("changelist", &HaveRow::changelist),
                          make_column("digest", &HaveRow::digest)));
}

using StateStorage = decltype(create_state_storage(""));

} // namespace

struct StateStore::Impl {
  StateStorage storage;
  Impl(const std::string &path) : storage(create_state_storage(path)) {}
};

std::string StateStore::databasePath(const std::string &trackedDir) {
  return (fs::path(trackedDir) / WorkspaceScanner::kStateDir / "state.db")
      .string();
}

StateStore::StateStore(const std::string &trackedDir)
    : m_dbPath(databasePath(trackedDir)) {}

StateStore::~StateStore() = default;

void StateStore::open() {
  std::error_code ec;
  fs::create_directories(fs::path(m_dbPath).parent_path(), ec);
  if (ec)
    throw StateError("Cannot create state directory for " + m_dbPath + ": " +
                     ec.message());
  try {
    m_impl = std::make_unique<Impl>(m_dbPath);
    initializeSchema();
  } catch (const std::system_error &e) {
    throw StateError("Cannot open state database " + m_dbPath + ": " +
                     e.what());
  }
}

void StateStore::initializeSchema() {
  if (!m_impl)
    throw StateError("State database is not open: " + m_dbPath);
  m_impl->storage.sync_schema();
}

int64_t StateStore::lastSynced() {
  if (!m_impl)
    throw StateError("State database is not open: " + m_dbPath);
  try {
    auto row = m_impl->storage.get_pointer<SyncStateRow>(kStateRowId);
    return row ? row->lastSynced : 0;
  } catch (const std::system_error &e) {
    throw StateError(std::string("Cannot read sync state: ") + e.what());
  }
}

std::optional<HaveEntry> StateStore::haveEntry(const std::string &path) {
  if (!m_impl)
    throw StateError("State database is not open: " + m_dbPath);
  try {
    auto row = m_impl->storage.get_pointer<HaveRow>(path);
    if (!row)
      return std::nullopt;
    return HaveEntry{row->path, row->changelist, row->digest};
  } catch (const std::system_error &e) {
    throw StateError(std::string("Cannot read have-list: ") + e.what());
  }
}

LocalState StateStore::load() {
  LocalState state;
  state.lastSynced = lastSynced();
  try {
    for (const auto &row : m_impl->storage.get_all<HaveRow>()) {
      state.haveList.emplace(row.path,
                             HaveEntry{row.path, row.changelist, row.digest});
    }
  } catch (const std::system_error &e) {
    throw StateError(std::string("Cannot read have-list: ") + e.what());
  }
  std::cerr << "[State] Loaded " << m_dbPath << ": last synced "
            << state.lastSynced << ", " << state.haveList.size()
            << " have-list entries" << std::endl;
  return state;
}

void StateStore::commit(int64_t lastSynced, const RecordList &confirmed,
                        bool updateHaveList) {
  if (!m_impl)
    throw StateError("State database is not open: " + m_dbPath);
  try {
    m_impl->storage.transaction([&]() {
      m_impl->storage.replace(SyncStateRow{kStateRowId, lastSynced});
      if (updateHaveList) {
        for (const auto &record : confirmed) {
          if (record.isDeletion())
            m_impl->storage.remove<HaveRow>(record.path);
          else
            m_impl->storage.replace(
                HaveRow{record.path, record.change, record.digest});
        }
      }
      return true;
    });
  } catch (const std::system_error &e) {
    throw StateError(std::string("Cannot commit sync state: ") + e.what());
  }
  std::cerr << "[State] Committed changelist " << lastSynced << " ("
            << confirmed.size() << " records)" << std::endl;
}

} // namespace depotsync
