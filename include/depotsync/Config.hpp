#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace depotsync {

/**
 * Config holds every tunable of the client and the cache server. It is
 * loaded once at startup and passed around by const reference.
 *
 * Lookup order: $DEPOTSYNC_CONFIG, then ~/.depotsync.json. A missing default
 * file yields the defaults below.
 */
struct Config {
  // Cache service client
  std::string serviceUrl; // empty: always query the authoritative source
  std::string username;
  std::string password;
  std::string proxyUrl;
  int serviceTimeoutSeconds = 10;

  // Reconciliation
  std::string depotPrefix;
  std::size_t workers = 4;
  std::size_t batchBytes = 10 * 1024 * 1024;
  std::size_t channelCapacity = 1024;
  std::vector<std::string> transferCommand;
  std::vector<std::string> forceArguments{"-f"};
  std::vector<std::string> fstatCommand;
  std::vector<std::string> headCommand;
  bool caseInsensitive = defaultCaseInsensitive();
  bool haveList = true;
  bool trustHaveList = false;
  std::size_t progressInterval = 500;
  std::size_t localCacheEntries = 16; // 0: no per-directory fstat cache

  // Cache server
  std::string serverHost = "0.0.0.0";
  int serverPort = 8080;
  std::string cacheDb = "depotsync-cache.db";
  std::string spoolDir;
  std::vector<std::string> ingestPrefixes;
  int ingestIntervalSeconds = 60;
  std::size_t maxEntriesPerPrefix = 0; // 0: unlimited

  static bool defaultCaseInsensitive();

  // Throws ConfigError on unreadable files, bad JSON or invalid values.
  static Config load();
  static Config loadFile(const std::string &path);
  static Config parse(const std::string &text);

  void validate() const;
};

} // namespace depotsync
