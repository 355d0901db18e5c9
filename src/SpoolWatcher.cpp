#include "depotsync/SpoolWatcher.hpp"
#include <atomic>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace depotsync {

namespace {

enum class SettleState { Polling, Settling };

struct PendingFile {
  fs::file_time_type lastMTime;
  std::chrono::steady_clock::time_point nextCheck;
  SettleState state;
};

bool isSpoolFile(const std::string &path) {
  return fs::path(path).extension() == ".fstat";
}

} // namespace

struct SpoolWatcher::Impl : public efsw::FileWatchListener {
  efsw::FileWatcher watcher;
  efsw::WatchID watchId = 0;
  bool running = false;

  // Debouncing members
  std::map<std::string, PendingFile> pendingFiles;
  std::mutex mtx;
  std::thread workerThread;
  std::atomic<bool> workerRunning{false};
  SpoolWatcher::Callback callback;

  std::chrono::milliseconds pollInterval{100};
  std::chrono::milliseconds settleTime{2000};

  void workerLoop() {
    while (workerRunning) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));

      std::vector<std::string> ready;
      {
        std::lock_guard<std::mutex> lock(mtx);
        auto now = std::chrono::steady_clock::now();

        for (auto it = pendingFiles.begin(); it != pendingFiles.end();) {
          if (now < it->second.nextCheck) {
            ++it;
            continue;
          }

          const std::string &path = it->first;
          std::error_code ec;
          if (!fs::exists(path, ec)) {
            it = pendingFiles.erase(it);
            continue;
          }
          auto currentMTime = fs::last_write_time(path, ec);
          if (ec) {
            it->second.nextCheck = now + pollInterval;
            ++it;
            continue;
          }

          if (currentMTime != it->second.lastMTime) {
            // Still being written: back to polling
            it->second.lastMTime = currentMTime;
            it->second.nextCheck = now + pollInterval;
            it->second.state = SettleState::Polling;
            ++it;
          } else if (it->second.state == SettleState::Polling) {
            it->second.state = SettleState::Settling;
            it->second.nextCheck = now + settleTime;
            ++it;
          } else {
            ready.push_back(path);
            it = pendingFiles.erase(it);
          }
        }
      }

      // Outside the lock: ingestion may take a while.
      for (const auto &path : ready) {
        if (callback)
          callback(path);
      }
    }
  }

  void pushFile(const std::string &path) {
    if (!isSpoolFile(path))
      return;
    std::lock_guard<std::mutex> lock(mtx);
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec)
      mtime = (fs::file_time_type::min)();
    pendingFiles[path] =
        PendingFile{mtime, std::chrono::steady_clock::now() + pollInterval,
                    SettleState::Polling};
  }

  // Implement FileWatchListener
  void handleFileAction(efsw::WatchID, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string) override {
    std::string fullPath =
        (fs::path(dir) / filename).lexically_normal().generic_string();
    switch (action) {
    case efsw::Actions::Add:
    case efsw::Actions::Modified:
    case efsw::Actions::Moved:
      if (!fs::is_directory(fullPath))
        pushFile(fullPath);
      break;
    case efsw::Actions::Delete: {
      std::lock_guard<std::mutex> lock(mtx);
      pendingFiles.erase(fullPath);
      break;
    }
    default:
      break;
    }
  }
};

SpoolWatcher::SpoolWatcher(const std::string &path, Callback callback,
                           std::chrono::milliseconds settleTime)
    : m_impl(std::make_unique<Impl>()), m_path(path) {
  m_impl->callback = std::move(callback);
  m_impl->settleTime = settleTime;
}

SpoolWatcher::~SpoolWatcher() { stop(); }

bool SpoolWatcher::start() {
  if (m_impl->running)
    return true;

  std::error_code ec;
  fs::create_directories(m_path, ec);
  if (ec) {
    std::cerr << "[Spool] Cannot create spool directory " << m_path << ": "
              << ec.message() << std::endl;
    return false;
  }

  m_impl->watchId = m_impl->watcher.addWatch(m_path, m_impl.get(), false);
  if (m_impl->watchId < 0) {
    std::cerr << "[Spool] Error starting watcher: "
              << efsw::Errors::Log::getLastErrorLog() << std::endl;
    return false;
  }

  m_impl->workerRunning = true;
  m_impl->workerThread = std::thread(&Impl::workerLoop, m_impl.get());
  m_impl->watcher.watch();
  m_impl->running = true;

  // Files dropped while nobody was watching
  for (fs::directory_iterator it(m_path, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec))
      m_impl->pushFile(it->path().lexically_normal().generic_string());
  }

  std::cout << "[Spool] Started monitoring (with debouncing): " << m_path
            << std::endl;
  return true;
}

void SpoolWatcher::stop() {
  if (!m_impl->running)
    return;

  m_impl->watcher.removeWatch(m_impl->watchId);

  m_impl->workerRunning = false;
  if (m_impl->workerThread.joinable())
    m_impl->workerThread.join();

  m_impl->running = false;
  std::cout << "[Spool] Stopped monitoring: " << m_path << std::endl;
}

} // namespace depotsync
