#include "depotsync/CacheService.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FstatCodec.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace depotsync {

namespace {
const char kSpoolSuffix[] = ".fstat";

std::string replaceAll(std::string text, const std::string &from,
                       const std::string &to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}
} // namespace

CacheService::CacheService(FstatCache &cache, FstatSource *source)
    : m_cache(cache), m_source(source) {}

CacheAnswer CacheService::query(const std::string &prefix, int64_t from,
                                int64_t to) {
  CacheAnswer answer;
  if (from >= to) {
    answer.outcome = CacheOutcome::Full;
    return answer;
  }

  if (auto records = m_cache.records(prefix, to, from)) {
    answer.outcome = CacheOutcome::Full;
    answer.records = latestPerPath(std::move(*records));
    return answer;
  }

  if (auto below = m_cache.highestBetween(prefix, from, to)) {
    if (auto records = m_cache.records(prefix, *below, from)) {
      answer.outcome = CacheOutcome::Redirect;
      answer.redirectTo = *below;
      answer.records = latestPerPath(std::move(*records));
      return answer;
    }
  }
  return answer;
}

bool CacheService::ingest(const std::string &prefix, int64_t changelist) {
  if (changelist < 1)
    throw Error("Cannot ingest changelist " + std::to_string(changelist));
  if (m_cache.contains(prefix, changelist))
    return false;
  if (!m_source)
    throw Error("No fstat source configured for ingestion");

  RecordList state;
  int64_t base = 0;
  if (auto below = m_cache.highestBetween(prefix, 0, changelist)) {
    base = *below;
    state = m_cache.records(prefix, base).value_or(RecordList{});
  }
  for (auto &record : m_source->changes(prefix, base, changelist))
    state.push_back(std::move(record));
  state = latestPerPath(std::move(state));

  bool written = m_cache.insert(prefix, changelist, state);
  if (written) {
    std::cout << "[Cache] Ingested " << prefix << "@" << changelist << " ("
              << state.size() << " records, base " << base << ")"
              << std::endl;
  }
  return written;
}

bool CacheService::ingestHead(const std::string &prefix) {
  if (!m_source)
    throw Error("No fstat source configured for ingestion");
  return ingest(prefix, m_source->head(prefix));
}

bool CacheService::ingestFile(const std::string &path) {
  auto key = parseSpoolName(fs::path(path).filename().string());
  if (!key)
    throw Error("Not a spool file name: " + path);

  std::ifstream in(path);
  if (!in.is_open())
    throw Error("Cannot read spool file: " + path);

  RecordList records;
  while (auto record = FstatCodec::read(in)) {
    if (record->change > key->second)
      throw MalformedRecord("change past the entry's changelist",
                            FstatCodec::encode(*record));
    records.push_back(std::move(*record));
  }

  bool written =
      m_cache.insert(key->first, key->second, latestPerPath(std::move(records)));
  std::cout << "[Spool] " << (written ? "Ingested " : "Already cached: ")
            << key->first << "@" << key->second << std::endl;
  return written;
}

std::size_t CacheService::prune(const std::string &prefix) {
  return m_cache.prune(prefix);
}

std::size_t CacheService::pruneIfAbove(const std::string &prefix,
                                       std::size_t maxEntries) {
  return m_cache.pruneIfAbove(prefix, maxEntries);
}

std::vector<int64_t> CacheService::changelists(const std::string &prefix) {
  return m_cache.changelists(prefix);
}

std::string CacheService::safePrefix(const std::string &prefix) {
  return replaceAll(prefix, "/", "__");
}

std::string CacheService::prefixFromSafe(const std::string &safe) {
  return replaceAll(safe, "__", "/");
}

std::optional<std::pair<std::string, int64_t>>
CacheService::parseSpoolName(const std::string &filename) {
  const std::size_t suffixLength = sizeof(kSpoolSuffix) - 1;
  if (filename.size() <= suffixLength ||
      filename.compare(filename.size() - suffixLength, suffixLength,
                       kSpoolSuffix) != 0)
    return std::nullopt;
  std::string stem = filename.substr(0, filename.size() - suffixLength);
  auto at = stem.rfind('@');
  if (at == std::string::npos || at == 0 || at + 1 == stem.size())
    return std::nullopt;

  std::string number = stem.substr(at + 1);
  int64_t changelist = 0;
  for (char c : number) {
    if (c < '0' || c > '9' || changelist > (INT64_MAX - 9) / 10)
      return std::nullopt;
    changelist = changelist * 10 + (c - '0');
  }
  if (changelist < 1)
    return std::nullopt;
  return std::make_pair(prefixFromSafe(stem.substr(0, at)), changelist);
}

} // namespace depotsync
