#pragma once
#include "types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace depotsync {

/**
 * FstatCache stores cache entries keyed by (prefix, changelist). An entry
 * holds the cumulative state of the prefix at that changelist and is never
 * modified once written; it can only be removed.
 *
 * The cache server keeps one shared database; each tracked directory keeps
 * its own in .depotsync/fstat.db.
 */
class FstatCache {
public:
  explicit FstatCache(const std::string &dbPath);
  ~FstatCache();

  static std::string localPath(const std::string &trackedDir);

  // Creates the parent directory, opens the database and synchronizes the
  // schema. Throws Error.
  void open();

  // Stores the entry unless one exists for the key. Returns true if written.
  bool insert(const std::string &prefix, int64_t changelist,
              const RecordList &records);
  bool contains(const std::string &prefix, int64_t changelist);

  // Records of the entry with change > after; nullopt if there is no entry.
  std::optional<RecordList> records(const std::string &prefix,
                                    int64_t changelist, int64_t after = 0);

  // Changelists with an entry, ascending.
  std::vector<int64_t> changelists(const std::string &prefix);
  std::vector<std::string> prefixes();

  // Highest entry strictly between lower and upper.
  std::optional<int64_t> highestBetween(const std::string &prefix,
                                        int64_t lower, int64_t upper);

  void remove(const std::string &prefix, int64_t changelist);

  // Removes every other entry, keeping the oldest and the newest. Returns
  // the number removed.
  std::size_t prune(const std::string &prefix);
  std::size_t pruneIfAbove(const std::string &prefix, std::size_t maxEntries);

private:
  std::string m_dbPath;
  std::mutex m_mutex;
  struct Impl;
  std::unique_ptr<Impl> m_impl;

  Impl &impl();
};

} // namespace depotsync
