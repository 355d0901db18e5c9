#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace depotsync {

/**
 * StateStore persists the LocalState of one tracked directory in
 * <dir>/.depotsync/state.db: the last synced changelist and the have-list.
 * Only the reconciliation controller writes to it, once per successful sync.
 */
class StateStore {
public:
  explicit StateStore(const std::string &trackedDir);
  ~StateStore();

  static std::string databasePath(const std::string &trackedDir);

  // Creates the state directory and schema. Throws StateError.
  void open();
  void initializeSchema();

  LocalState load();
  int64_t lastSynced();
  std::optional<HaveEntry> haveEntry(const std::string &path);

  // Records a verified sync in one transaction. Deletions leave the
  // have-list; every other record replaces the entry for its path.
  void commit(int64_t lastSynced, const RecordList &confirmed,
              bool updateHaveList);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace depotsync
