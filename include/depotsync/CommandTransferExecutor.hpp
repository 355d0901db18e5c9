#pragma once
#include "Dispatcher.hpp"
#include <map>
#include <string>
#include <vector>

namespace depotsync {

/**
 * CommandTransferExecutor runs the native repository client once per batch
 * inside the tracked directory. Each record becomes one file spec line on
 * the command's stdin:
 *
 *   <depot prefix>/<escaped path>#<revision>
 *
 * In force mode the force arguments are appended to the command line.
 * When the command fails, stderr lines naming a file spec fail only that
 * record; otherwise the first stderr line fails the batch.
 */
class CommandTransferExecutor : public TransferExecutor {
public:
  CommandTransferExecutor(std::vector<std::string> command,
                          std::vector<std::string> forceArguments,
                          std::string depotPrefix, std::string workingDir);

  TransferResult execute(const Batch &batch, TransferMode mode) override;

  // Escapes the characters the repository reserves in file specs.
  static std::string escapePath(const std::string &path);
  std::string fileSpec(const FstatRecord &record) const;
  std::map<std::string, std::string> recordErrors(const Batch &batch,
                                                  const std::string &err) const;

private:
  std::vector<std::string> m_command;
  std::vector<std::string> m_forceArguments;
  std::string m_depotPrefix;
  std::string m_workingDir;
};

} // namespace depotsync
