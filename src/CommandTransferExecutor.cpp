#include "depotsync/CommandTransferExecutor.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/Process.hpp"
#include <map>
#include <sstream>
#include <utility>

namespace depotsync {

namespace {
std::string firstLine(const std::string &text) {
  auto end = text.find('\n');
  std::string line = text.substr(0, end);
  while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
    line.pop_back();
  return line;
}
} // namespace

CommandTransferExecutor::CommandTransferExecutor(
    std::vector<std::string> command, std::vector<std::string> forceArguments,
    std::string depotPrefix, std::string workingDir)
    : m_command(std::move(command)),
      m_forceArguments(std::move(forceArguments)),
      m_depotPrefix(std::move(depotPrefix)),
      m_workingDir(std::move(workingDir)) {
  if (m_command.empty())
    throw ConfigError("transfer_command is not configured");
  while (!m_depotPrefix.empty() && m_depotPrefix.back() == '/')
    m_depotPrefix.pop_back();
}

std::string CommandTransferExecutor::escapePath(const std::string &path) {
  std::string out;
  out.reserve(path.size());
  for (char c : path) {
    switch (c) {
    case '%':
      out += "%25";
      break;
    case '@':
      out += "%40";
      break;
    case '#':
      out += "%23";
      break;
    case '*':
      out += "%2A";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string CommandTransferExecutor::fileSpec(const FstatRecord &record) const {
  return m_depotPrefix + "/" + escapePath(record.path) + "#" +
         std::to_string(record.revision);
}

// The client reports per-file problems as "<spec>[#rev] - <reason>".
std::map<std::string, std::string>
CommandTransferExecutor::recordErrors(const Batch &batch,
                                      const std::string &err) const {
  std::map<std::string, std::string> errors;
  std::istringstream lines(err);
  std::string line;
  while (std::getline(lines, line)) {
    for (const auto &record : batch.records) {
      std::string spec = m_depotPrefix + "/" + escapePath(record.path);
      if (line.compare(0, spec.size(), spec) != 0)
        continue;
      auto rest = line.substr(spec.size());
      if (!rest.empty() && rest[0] == '#')
        rest.erase(0, rest.find_first_not_of("0123456789", 1));
      if (rest.compare(0, 3, " - ") != 0)
        continue;
      if (!errors.count(record.path))
        errors[record.path] = firstLine(rest.substr(3));
      break;
    }
  }
  return errors;
}

TransferResult CommandTransferExecutor::execute(const Batch &batch,
                                                TransferMode mode) {
  std::vector<std::string> argv = m_command;
  if (mode == TransferMode::Force)
    argv.insert(argv.end(), m_forceArguments.begin(), m_forceArguments.end());

  std::string input;
  for (const auto &record : batch.records)
    input += fileSpec(record) + "\n";

  auto result = Process::run(argv, input, m_workingDir);

  TransferResult transfer;
  transfer.success = result.exitCode == 0;
  if (!transfer.success) {
    transfer.message = firstLine(result.err);
    if (transfer.message.empty())
      transfer.message = "exit status " + std::to_string(result.exitCode);
    transfer.recordErrors = recordErrors(batch, result.err);
  }
  return transfer;
}

} // namespace depotsync
