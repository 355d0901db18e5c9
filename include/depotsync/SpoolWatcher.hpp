#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace depotsync {

/**
 * SpoolWatcher monitors the spool directory for dropped *.fstat files and
 * reports each one once its modification time has stopped changing.
 * Files already present when the watcher starts are reported too.
 */
class SpoolWatcher {
public:
  using Callback = std::function<void(const std::string &path)>;

  SpoolWatcher(const std::string &path, Callback callback,
               std::chrono::milliseconds settleTime =
                   std::chrono::milliseconds(2000));
  ~SpoolWatcher();

  bool start();
  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_path;
};

} // namespace depotsync
