#include "depotsync/FstatQuery.hpp"
#include <iostream>
#include <map>
#include <utility>

namespace depotsync {

FstatQuery::FstatQuery(FstatSource &source, ServiceClient *service,
                       FstatCache *local, std::size_t localEntries)
    : m_source(source), m_service(service), m_local(local),
      m_localEntries(localEntries) {}

int64_t FstatQuery::head(const std::string &prefix) {
  return m_source.head(prefix);
}

RecordList FstatQuery::changes(const std::string &prefix, int64_t from,
                               int64_t to) {
  if (from >= to)
    return {};
  if (!m_local)
    return fetch(prefix, from, to);

  if (auto cached = m_local->records(prefix, to, from)) {
    std::cerr << "[Query] " << prefix << " (" << from << "," << to
              << "] from local cache: " << cached->size() << " records"
              << std::endl;
    return latestPerPath(std::move(*cached));
  }

  auto below = m_local->highestBetween(prefix, 0, to);
  // Without a base entry only a query from zero yields a complete state.
  if (!below && from > 0)
    return fetch(prefix, from, to);

  int64_t base = below.value_or(0);
  RecordList state;
  if (below)
    state = m_local->records(prefix, base).value_or(RecordList{});
  for (auto &record : fetch(prefix, base, to))
    state.push_back(std::move(record));
  state = latestPerPath(std::move(state));

  if (m_local->insert(prefix, to, state)) {
    std::cerr << "[Query] Cached " << prefix << "@" << to << " locally ("
              << state.size() << " records, base " << base << ")"
              << std::endl;
    m_local->pruneIfAbove(prefix, m_localEntries);
  }

  RecordList result;
  for (auto &record : state) {
    if (record.change > from)
      result.push_back(std::move(record));
  }
  return result;
}

RecordList FstatQuery::fetch(const std::string &prefix, int64_t from,
                             int64_t to) {
  if (from >= to)
    return {};

  if (m_service) {
    auto response = m_service->fstat(prefix, from, to);
    if (response && response->status == QueryStatus::Full) {
      std::cerr << "[Query] " << prefix << " (" << from << "," << to
                << "] from cache: " << response->records.size()
                << " records" << std::endl;
      return latestPerPath(std::move(response->records));
    }
    if (response && response->status == QueryStatus::Redirect) {
      int64_t r = response->redirectTo;
      std::cerr << "[Query] " << prefix << " (" << from << "," << to
                << "] redirected to " << r << ", fetching (" << r << "," << to
                << "] from the source" << std::endl;
      RecordList merged = std::move(response->records);
      for (auto &record : m_source.changes(prefix, r, to))
        merged.push_back(std::move(record));
      return latestPerPath(std::move(merged));
    }
  }

  return latestPerPath(m_source.changes(prefix, from, to));
}

RecordList FstatQuery::revert(const std::string &prefix, int64_t target,
                              int64_t current) {
  RecordList changed = changes(prefix, target, current);
  if (changed.empty())
    return {};

  std::map<std::string, FstatRecord> atTarget;
  for (auto &record : changes(prefix, 0, target))
    atTarget.emplace(record.path, std::move(record));

  RecordList result;
  result.reserve(changed.size());
  for (const auto &record : changed) {
    auto it = atTarget.find(record.path);
    if (it != atTarget.end()) {
      result.push_back(it->second);
      continue;
    }
    // The path is younger than the target: revision 0 removes it.
    FstatRecord removal;
    removal.change = target;
    removal.path = record.path;
    removal.revision = 0;
    removal.action = Action::Delete;
    removal.fileType = record.fileType;
    result.push_back(std::move(removal));
  }
  return latestPerPath(std::move(result));
}

} // namespace depotsync
