#pragma once
#include <string>
#include <utility>
#include <vector>

namespace depotsync {

struct ProcessResult {
  int exitCode = -1; // 128 + signal when the child was killed
  std::string out;
  std::string err;
};

/**
 * Process runs an external command to completion. The input is written to
 * its stdin while stdout and stderr are collected, so a child that writes
 * before reading all of its input can not deadlock.
 */
class Process {
public:
  // Throws depotsync::Error if the command can not be started.
  static ProcessResult run(const std::vector<std::string> &argv,
                           const std::string &input,
                           const std::string &workingDir = "");
};

// Replaces every {name} in the arguments by its value.
std::vector<std::string>
substitute(const std::vector<std::string> &args,
           const std::vector<std::pair<std::string, std::string>> &values);

} // namespace depotsync
