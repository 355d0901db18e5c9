#include "depotsync/FstatCache.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FstatCodec.hpp"
#include "depotsync/WorkspaceScanner.hpp"
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;
namespace fs = std::filesystem;

namespace depotsync {

namespace {

struct CacheSnapshot {
  std::string prefix;
  int64_t changelist = 0;
  int64_t recordCount = 0;
  int64_t createdAt = 0;
};

struct SnapshotRecord {
  std::string prefix;
  int64_t snapshot = 0;
  std::string path;
  int64_t change = 0;
  std::string line;
};

// Helper to deduce the storage type.
inline auto create_cache_storage(const std::string &path) {
  return make_storage(
      path,
      make_table<CacheSnapshot>(
          "CacheSnapshot", make_column("prefix", &CacheSnapshot::prefix),
          make_column("changelist", &CacheSnapshot::changelist),
          make_column("record_count", &CacheSnapshot::recordCount),
          make_column("created_at", &CacheSnapshot::createdAt),
          primary_key(&CacheSnapshot::prefix, &CacheSnapshot::changelist)),
      make_table<SnapshotRecord>(
          "SnapshotRecord", make_column("prefix", &SnapshotRecord::prefix),
          make_column("snapshot", &SnapshotRecord::snapshot),
          make_column("path", &SnapshotRecord::path),
          make_column("change", &SnapshotRecord::change),
          make_column("line", &SnapshotRecord::line),
          primary_key(&SnapshotRecord::prefix, &SnapshotRecord::snapshot,
                      &SnapshotRecord::path)));
}

using CacheStorage = decltype(create_cache_storage(""));

} // namespace

struct FstatCache::Impl {
  CacheStorage storage;
  Impl(const std::string &path) : storage(create_cache_storage(path)) {}
};

FstatCache::FstatCache(const std::string &dbPath) : m_dbPath(dbPath) {}

FstatCache::~FstatCache() = default;

FstatCache::Impl &FstatCache::impl() {
  if (!m_impl)
    throw Error("Cache database is not open: " + m_dbPath);
  return *m_impl;
}

std::string FstatCache::localPath(const std::string &trackedDir) {
  return (fs::path(trackedDir) / WorkspaceScanner::kStateDir / "fstat.db")
      .string();
}

void FstatCache::open() {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto parent = fs::path(m_dbPath).parent_path();
  std::error_code ec;
  if (!parent.empty())
    fs::create_directories(parent, ec);
  if (ec)
    throw Error("Cannot create cache directory for " + m_dbPath + ": " +
                ec.message());
  try {
    m_impl = std::make_unique<Impl>(m_dbPath);
    std::cout << "[Cache] Synchronizing schema via sqlite_orm..." << std::endl;
    m_impl->storage.sync_schema();
    std::cout << "[Cache] Database ready: " << m_dbPath << std::endl;
  } catch (const std::system_error &e) {
    m_impl.reset();
    throw Error("Cannot open cache database " + m_dbPath + ": " + e.what());
  }
}

bool FstatCache::insert(const std::string &prefix, int64_t changelist,
                        const RecordList &records) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto &storage = impl().storage;
  bool written = false;
  try {
    storage.transaction([&]() {
      if (storage.get_pointer<CacheSnapshot>(prefix, changelist))
        return true;
      for (const auto &record : records) {
        storage.replace(SnapshotRecord{prefix, changelist, record.path,
                                       record.change,
                                       FstatCodec::encode(record)});
      }
      storage.replace(CacheSnapshot{prefix, changelist,
                                    static_cast<int64_t>(records.size()),
                                    static_cast<int64_t>(std::time(nullptr))});
      written = true;
      return true;
    });
  } catch (const std::system_error &e) {
    throw Error("Cannot store cache entry " + prefix + "@" +
                std::to_string(changelist) + ": " + e.what());
  }
  return written;
}

bool FstatCache::contains(const std::string &prefix, int64_t changelist) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return impl().storage.get_pointer<CacheSnapshot>(prefix, changelist) !=
         nullptr;
}

std::optional<RecordList> FstatCache::records(const std::string &prefix,
                                              int64_t changelist,
                                              int64_t after) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto &storage = impl().storage;
  if (!storage.get_pointer<CacheSnapshot>(prefix, changelist))
    return std::nullopt;

  auto lines = storage.select(
      &SnapshotRecord::line,
      where(c(&SnapshotRecord::prefix) == prefix and
            c(&SnapshotRecord::snapshot) == changelist and
            c(&SnapshotRecord::change) > after),
      order_by(&SnapshotRecord::path));

  RecordList result;
  result.reserve(lines.size());
  for (const auto &line : lines)
    result.push_back(FstatCodec::decode(line));
  return result;
}

std::vector<int64_t> FstatCache::changelists(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return impl().storage.select(&CacheSnapshot::changelist,
                               where(c(&CacheSnapshot::prefix) == prefix),
                               order_by(&CacheSnapshot::changelist));
}

std::vector<std::string> FstatCache::prefixes() {
  std::lock_guard<std::mutex> lock(m_mutex);
  return impl().storage.select(distinct(&CacheSnapshot::prefix));
}

std::optional<int64_t> FstatCache::highestBetween(const std::string &prefix,
                                                  int64_t lower,
                                                  int64_t upper) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto found = impl().storage.select(
      &CacheSnapshot::changelist,
      where(c(&CacheSnapshot::prefix) == prefix and
            c(&CacheSnapshot::changelist) > lower and
            c(&CacheSnapshot::changelist) < upper),
      order_by(&CacheSnapshot::changelist).desc(), limit(1));
  if (found.empty())
    return std::nullopt;
  return found.front();
}

void FstatCache::remove(const std::string &prefix, int64_t changelist) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto &storage = impl().storage;
  storage.transaction([&]() {
    storage.remove_all<SnapshotRecord>(
        where(c(&SnapshotRecord::prefix) == prefix and
              c(&SnapshotRecord::snapshot) == changelist));
    storage.remove<CacheSnapshot>(prefix, changelist);
    return true;
  });
  std::cout << "[Cache] Removed " << prefix << "@" << changelist << std::endl;
}

std::size_t FstatCache::prune(const std::string &prefix) {
  auto entries = changelists(prefix);
  if (entries.size() < 3)
    return 0;
  std::size_t removed = 0;
  // Odd positions go; the newest stays even when it sits at one.
  for (std::size_t i = 1; i + 1 < entries.size(); i += 2) {
    remove(prefix, entries[i]);
    ++removed;
  }
  return removed;
}

std::size_t FstatCache::pruneIfAbove(const std::string &prefix,
                                     std::size_t maxEntries) {
  if (maxEntries == 0 || changelists(prefix).size() <= maxEntries)
    return 0;
  return prune(prefix);
}

} // namespace depotsync
