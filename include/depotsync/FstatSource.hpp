#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace depotsync {

/**
 * FstatSource is the authoritative answer to "what changed under this
 * prefix between two changelists".
 */
class FstatSource {
public:
  virtual ~FstatSource() = default;

  // Records changed in (from, to], at most one per path.
  virtual RecordList changes(const std::string &prefix, int64_t from,
                             int64_t to) = 0;
  virtual int64_t head(const std::string &prefix) = 0;
};

/**
 * CommandFstatSource asks the native client. The commands receive {prefix},
 * {from} and {to} substituted into their arguments; the fstat command
 * prints records in the line format, the head command prints the newest
 * changelist. Failed runs are retried before a SourceError is raised.
 */
class CommandFstatSource : public FstatSource {
public:
  static constexpr int kDefaultAttempts = 3;

  CommandFstatSource(std::vector<std::string> fstatCommand,
                     std::vector<std::string> headCommand,
                     std::string workingDir = "",
                     int attempts = kDefaultAttempts);

  RecordList changes(const std::string &prefix, int64_t from,
                     int64_t to) override;
  int64_t head(const std::string &prefix) override;

private:
  std::vector<std::string> m_fstatCommand;
  std::vector<std::string> m_headCommand;
  std::string m_workingDir;
  int m_attempts;

  std::string runWithRetries(const std::vector<std::string> &argv,
                             const std::string &what);
};

// Keeps the newest record per path, ordered by change (newest first) and
// then by path.
RecordList latestPerPath(RecordList records);

} // namespace depotsync
