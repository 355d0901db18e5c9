#include "depotsync/CacheServer.hpp"
#include "depotsync/CacheService.hpp"
#include "depotsync/Config.hpp"
#include "depotsync/FstatCache.hpp"
#include "depotsync/FstatSource.hpp"
#include "depotsync/SpoolWatcher.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace fs = std::filesystem;

std::atomic<bool> running{true};
std::mutex cv_m;
std::condition_variable cv;

static void signalHandler(int sig) {
  std::cout << "[Main] Shutdown signal received (" << sig << ")" << std::endl;
  running.store(false);
  cv.notify_all();
}

namespace {

void ingestLoop(depotsync::CacheService &service, depotsync::FstatCache &cache,
                const depotsync::Config &config) {
  while (running.load()) {
    std::set<std::string> prefixes(config.ingestPrefixes.begin(),
                                   config.ingestPrefixes.end());
    for (const auto &prefix : prefixes) {
      try {
        service.ingestHead(prefix);
      } catch (const std::exception &e) {
        std::cerr << "[Ingest] " << prefix << ": " << e.what() << std::endl;
      }
    }
    if (config.maxEntriesPerPrefix > 0) {
      for (const auto &prefix : cache.prefixes()) {
        try {
          service.pruneIfAbove(prefix, config.maxEntriesPerPrefix);
        } catch (const std::exception &e) {
          std::cerr << "[Ingest] Prune " << prefix << ": " << e.what()
                    << std::endl;
        }
      }
    }

    std::unique_lock<std::mutex> lock(cv_m);
    cv.wait_for(lock, std::chrono::seconds(config.ingestIntervalSeconds),
                [] { return !running.load(); });
  }
}

} // namespace

int main() {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
  std::cout << "[Main] depotsync cache server starting..." << std::endl;

  try {
    const depotsync::Config config = depotsync::Config::load();

    depotsync::FstatCache cache(config.cacheDb);
    cache.open();
    std::cout << "[Main] Cache database: " << config.cacheDb << std::endl;

    std::unique_ptr<depotsync::CommandFstatSource> source;
    if (!config.fstatCommand.empty() && !config.headCommand.empty())
      source = std::make_unique<depotsync::CommandFstatSource>(
          config.fstatCommand, config.headCommand);
    else
      std::cout << "[Main] No fstat source configured; serving spooled "
                   "entries only."
                << std::endl;

    depotsync::CacheService service(cache, source.get());
    depotsync::CacheServer server(service);

    std::thread ingester;
    if (source && !config.ingestPrefixes.empty())
      ingester = std::thread(ingestLoop, std::ref(service), std::ref(cache),
                             std::cref(config));

    std::unique_ptr<depotsync::SpoolWatcher> watcher;
    if (!config.spoolDir.empty()) {
      watcher = std::make_unique<depotsync::SpoolWatcher>(
          config.spoolDir, [&service](const std::string &path) {
            try {
              service.ingestFile(path);
              std::error_code ec;
              fs::remove(path, ec);
              if (ec)
                std::cerr << "[Spool] Cannot remove " << path << ": "
                          << ec.message() << std::endl;
            } catch (const std::exception &e) {
              std::cerr << "[Spool] Rejected " << path << ": " << e.what()
                        << std::endl;
            }
          });
      if (!watcher->start())
        std::cerr << "[Main] Spool directory is not monitored." << std::endl;
    }

    std::atomic<bool> listenDone{false};
    std::thread listener([&server, &config, &listenDone] {
      bool ok = server.listen(config.serverHost, config.serverPort);
      listenDone.store(true);
      if (!ok) {
        std::cerr << "[Main] Cannot listen on " << config.serverHost << ":"
                  << config.serverPort << std::endl;
        running.store(false);
        cv.notify_all();
      }
    });

    std::cout << "[Main] Running. Press Ctrl+C to exit gracefully."
              << std::endl;
    {
      std::unique_lock<std::mutex> lock(cv_m);
      cv.wait(lock, [] { return !running.load(); });
    }

    // A signal may arrive before the listener is up.
    while (!listenDone.load()) {
      server.stop();
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    listener.join();
    if (watcher)
      watcher->stop();
    if (ingester.joinable())
      ingester.join();
    std::cout << "[Main] Finished." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
