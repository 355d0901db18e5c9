#pragma once
#include "FstatCache.hpp"
#include "FstatSource.hpp"
#include "ServiceClient.hpp"
#include "types.hpp"
#include <string>

namespace depotsync {

/**
 * FstatQuery answers changelist range queries for the controller. It asks
 * the cache service first when one is configured, fills the gap a redirect
 * leaves from the authoritative source, and falls back to the source for
 * the whole range when the service has nothing.
 *
 * With a local cache, an answer at `to` comes from the local entry at `to`
 * when there is one. Otherwise it is built from the nearest lower local
 * entry plus the delta from the service or source, and stored as the entry
 * at `to`. The local cache is pruned once it holds more than
 * `localEntries` entries for a prefix.
 */
class FstatQuery {
public:
  explicit FstatQuery(FstatSource &source, ServiceClient *service = nullptr,
                      FstatCache *local = nullptr,
                      std::size_t localEntries = 0);

  // Records changed in (from, to], newest per path.
  RecordList changes(const std::string &prefix, int64_t from, int64_t to);

  // Records that take a tree synced at `current` back to `target`
  // (target < current): every path changed in (target, current] at its
  // state at `target`, or a delete when it did not exist yet.
  RecordList revert(const std::string &prefix, int64_t target,
                    int64_t current);

  int64_t head(const std::string &prefix);

private:
  FstatSource &m_source;
  ServiceClient *m_service;
  FstatCache *m_local;
  std::size_t m_localEntries;

  RecordList fetch(const std::string &prefix, int64_t from, int64_t to);
};

} // namespace depotsync
