#include "depotsync/Config.hpp"
#include "depotsync/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace depotsync {

namespace {

template <typename T>
void read(const json &data, const char *key, T &target) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null())
    return;
  try {
    target = it->get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(std::string("Invalid value for '") + key +
                      "': " + e.what());
  }
}

void readCount(const json &data, const char *key, std::size_t &target) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null())
    return;
  if (!it->is_number_integer() || it->get<int64_t>() < 0)
    throw ConfigError(std::string("'") + key +
                      "' must be a non-negative integer");
  target = it->get<std::size_t>();
}

} // namespace

bool Config::defaultCaseInsensitive() {
#ifdef __APPLE__
  return true;
#else
  return false;
#endif
}

Config Config::parse(const std::string &text) {
  json data;
  try {
    data = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
  }
  if (!data.is_object())
    throw ConfigError("Config must be a JSON object");

  Config config;
  read(data, "service_url", config.serviceUrl);
  read(data, "username", config.username);
  read(data, "password", config.password);
  read(data, "proxy_url", config.proxyUrl);
  read(data, "service_timeout_seconds", config.serviceTimeoutSeconds);
  read(data, "depot_prefix", config.depotPrefix);
  readCount(data, "workers", config.workers);
  readCount(data, "batch_bytes", config.batchBytes);
  readCount(data, "channel_capacity", config.channelCapacity);
  read(data, "transfer_command", config.transferCommand);
  read(data, "force_arguments", config.forceArguments);
  read(data, "fstat_command", config.fstatCommand);
  read(data, "head_command", config.headCommand);
  read(data, "case_insensitive", config.caseInsensitive);
  read(data, "have_list", config.haveList);
  read(data, "trust_have_list", config.trustHaveList);
  readCount(data, "progress_interval", config.progressInterval);
  readCount(data, "local_cache_entries", config.localCacheEntries);
  read(data, "server_host", config.serverHost);
  read(data, "server_port", config.serverPort);
  read(data, "cache_db", config.cacheDb);
  read(data, "spool_dir", config.spoolDir);
  read(data, "ingest_prefixes", config.ingestPrefixes);
  read(data, "ingest_interval_seconds", config.ingestIntervalSeconds);
  readCount(data, "max_entries_per_prefix", config.maxEntriesPerPrefix);

  config.validate();
  return config;
}

Config Config::loadFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw ConfigError("Cannot read config file: " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    return parse(buffer.str());
  } catch (const ConfigError &e) {
    throw ConfigError(path + ": " + e.what());
  }
}

Config Config::load() {
  if (const char *explicitPath = std::getenv("DEPOTSYNC_CONFIG")) {
    if (*explicitPath)
      return loadFile(explicitPath);
  }
  if (const char *home = std::getenv("HOME")) {
    fs::path defaultPath = fs::path(home) / ".depotsync.json";
    std::error_code ec;
    if (fs::exists(defaultPath, ec))
      return loadFile(defaultPath.string());
  }
  return Config{};
}

void Config::validate() const {
  if (workers < 1)
    throw ConfigError("'workers' must be at least 1");
  if (batchBytes < 1)
    throw ConfigError("'batch_bytes' must be at least 1");
  if (channelCapacity < 1)
    throw ConfigError("'channel_capacity' must be at least 1");
  if (progressInterval < 1)
    throw ConfigError("'progress_interval' must be at least 1");
  if (serviceTimeoutSeconds < 1)
    throw ConfigError("'service_timeout_seconds' must be positive");
  if (serverPort < 1 || serverPort > 65535)
    throw ConfigError("'server_port' is out of range");
  if (ingestIntervalSeconds < 1)
    throw ConfigError("'ingest_interval_seconds' must be positive");
}

} // namespace depotsync
