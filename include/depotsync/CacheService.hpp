#pragma once
#include "FstatCache.hpp"
#include "FstatSource.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace depotsync {

enum class CacheOutcome { Full, Redirect, Miss };

struct CacheAnswer {
  CacheOutcome outcome = CacheOutcome::Miss;
  int64_t redirectTo = 0;
  RecordList records;
};

/**
 * CacheService answers (prefix, from, to] queries from the cache:
 *
 *   Full      an entry exists at `to`; its records changed after `from`
 *   Redirect  the highest entry R with from < R < to; its records changed
 *             after `from`. The caller fetches (R, to] elsewhere.
 *   Miss      nothing usable
 *
 * Entries are built by ingestion and never change afterwards.
 */
class CacheService {
public:
  explicit CacheService(FstatCache &cache, FstatSource *source = nullptr);

  CacheAnswer query(const std::string &prefix, int64_t from, int64_t to);

  // Builds the entry at `changelist` from the nearest lower entry and the
  // source's delta. Returns false if the entry already existed.
  bool ingest(const std::string &prefix, int64_t changelist);
  bool ingestHead(const std::string &prefix);

  // Ingests a spool file named <safe prefix>@<changelist>.fstat holding the
  // complete state at that changelist. Returns false if the entry existed.
  bool ingestFile(const std::string &path);

  // Removes every other entry, keeping the oldest and the newest. Returns
  // the number removed.
  std::size_t prune(const std::string &prefix);
  std::size_t pruneIfAbove(const std::string &prefix, std::size_t maxEntries);

  std::vector<int64_t> changelists(const std::string &prefix);

  static std::string safePrefix(const std::string &prefix);
  static std::string prefixFromSafe(const std::string &safe);
  static std::optional<std::pair<std::string, int64_t>>
  parseSpoolName(const std::string &filename);

private:
  FstatCache &m_cache;
  FstatSource *m_source;
};

} // namespace depotsync
