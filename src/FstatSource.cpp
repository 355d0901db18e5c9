#include "depotsync/FstatSource.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FstatCodec.hpp"
#include "depotsync/Process.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <sstream>
#include <thread>
#include <utility>

namespace depotsync {

RecordList latestPerPath(RecordList records) {
  std::map<std::string, FstatRecord> byPath;
  for (auto &record : records) {
    auto it = byPath.find(record.path);
    if (it == byPath.end())
      byPath.emplace(record.path, std::move(record));
    else if (record.change > it->second.change)
      it->second = std::move(record);
  }

  RecordList result;
  result.reserve(byPath.size());
  for (auto &kv : byPath)
    result.push_back(std::move(kv.second));
  std::stable_sort(result.begin(), result.end(),
                   [](const FstatRecord &a, const FstatRecord &b) {
                     return a.change > b.change;
                   });
  return result;
}

CommandFstatSource::CommandFstatSource(std::vector<std::string> fstatCommand,
                                       std::vector<std::string> headCommand,
                                       std::string workingDir, int attempts)
    : m_fstatCommand(std::move(fstatCommand)),
      m_headCommand(std::move(headCommand)),
      m_workingDir(std::move(workingDir)),
      m_attempts(attempts > 0 ? attempts : 1) {
  if (m_fstatCommand.empty())
    throw ConfigError("fstat_command is not configured");
  if (m_headCommand.empty())
    throw ConfigError("head_command is not configured");
}

std::string
CommandFstatSource::runWithRetries(const std::vector<std::string> &argv,
                                   const std::string &what) {
  std::string lastError;
  for (int attempt = 1; attempt <= m_attempts; ++attempt) {
    try {
      auto result = Process::run(argv, "", m_workingDir);
      if (result.exitCode == 0)
        return result.out;
      lastError = "exit status " + std::to_string(result.exitCode);
      if (!result.err.empty())
        lastError += ": " + result.err.substr(0, result.err.find('\n'));
    } catch (const Error &e) {
      lastError = e.what();
    }
    std::cerr << "[Query] " << what << " failed (attempt " << attempt << "/"
              << m_attempts << "): " << lastError << std::endl;
    if (attempt < m_attempts)
      std::this_thread::sleep_for(std::chrono::milliseconds(200 * attempt));
  }
  throw SourceError(what + " failed: " + lastError);
}

RecordList CommandFstatSource::changes(const std::string &prefix,
                                       int64_t from, int64_t to) {
  if (from >= to)
    return {};
  auto argv = substitute(m_fstatCommand, {{"prefix", prefix},
                                          {"from", std::to_string(from)},
                                          {"to", std::to_string(to)}});
  std::istringstream out(runWithRetries(
      argv, "fstat " + prefix + " (" + std::to_string(from) + "," +
                std::to_string(to) + "]"));

  RecordList records;
  while (auto record = FstatCodec::read(out)) {
    if (record->change > from && record->change <= to)
      records.push_back(std::move(*record));
  }
  return latestPerPath(std::move(records));
}

int64_t CommandFstatSource::head(const std::string &prefix) {
  auto argv = substitute(m_headCommand, {{"prefix", prefix}});
  std::istringstream out(runWithRetries(argv, "head " + prefix));
  int64_t changelist = 0;
  if (!(out >> changelist) || changelist < 0)
    throw SourceError("head " + prefix + " printed no changelist");
  return changelist;
}

} // namespace depotsync
