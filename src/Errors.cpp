#include "depotsync/Errors.hpp"
#include <utility>

namespace depotsync {

namespace {
std::string describeFailure(const std::vector<std::string> &paths,
                            std::size_t total) {
  std::string msg = "Pipeline ended with " + std::to_string(total) +
                    (total == 1 ? " file" : " files") + " rejected:";
  for (const auto &p : paths)
    msg += "\n  " + p;
  if (paths.size() < total)
    msg += "\n  ...and " + std::to_string(total - paths.size()) + " others";
  return msg;
}
} // namespace

VerificationFailure::VerificationFailure(std::vector<std::string> paths,
                                         std::size_t total)
    : Error(describeFailure(paths, total)), m_paths(std::move(paths)),
      m_total(total) {}

} // namespace depotsync
