#include "TestSupport.hpp"
#include "depotsync/Config.hpp"
#include "depotsync/Errors.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

using namespace depotsync;

TEST(ConfigTest, DefaultsWhenEmpty) {
  auto config = Config::parse("{}");
  EXPECT_TRUE(config.serviceUrl.empty());
  EXPECT_EQ(config.serviceTimeoutSeconds, 10);
  EXPECT_EQ(config.workers, 4u);
  EXPECT_EQ(config.batchBytes, 10u * 1024 * 1024);
  EXPECT_EQ(config.forceArguments, std::vector<std::string>{"-f"});
  EXPECT_TRUE(config.haveList);
  EXPECT_FALSE(config.trustHaveList);
  EXPECT_EQ(config.caseInsensitive, Config::defaultCaseInsensitive());
  EXPECT_EQ(config.serverPort, 8080);
  EXPECT_EQ(config.maxEntriesPerPrefix, 0u);
  EXPECT_EQ(config.localCacheEntries, 16u);
}

TEST(ConfigTest, ReadsEveryKey) {
  auto config = Config::parse(R"({
    "service_url": "http://cache:8080",
    "username": "builder",
    "password": "secret",
    "proxy_url": "http://proxy:3128",
    "service_timeout_seconds": 3,
    "depot_prefix": "//depot/main",
    "workers": 8,
    "batch_bytes": 4096,
    "channel_capacity": 16,
    "transfer_command": ["p4", "-x", "-", "sync"],
    "force_arguments": ["-f", "-q"],
    "fstat_command": ["depot-fstat", "{prefix}", "{from}", "{to}"],
    "head_command": ["depot-head", "{prefix}"],
    "case_insensitive": true,
    "have_list": false,
    "trust_have_list": true,
    "progress_interval": 10,
    "local_cache_entries": 0,
    "server_host": "127.0.0.1",
    "server_port": 9000,
    "cache_db": "/var/cache/depotsync.db",
    "spool_dir": "/var/spool/depotsync",
    "ingest_prefixes": ["//depot/main", "//depot/rel"],
    "ingest_interval_seconds": 30,
    "max_entries_per_prefix": 100
  })");
  EXPECT_EQ(config.serviceUrl, "http://cache:8080");
  EXPECT_EQ(config.username, "builder");
  EXPECT_EQ(config.password, "secret");
  EXPECT_EQ(config.proxyUrl, "http://proxy:3128");
  EXPECT_EQ(config.serviceTimeoutSeconds, 3);
  EXPECT_EQ(config.depotPrefix, "//depot/main");
  EXPECT_EQ(config.workers, 8u);
  EXPECT_EQ(config.batchBytes, 4096u);
  EXPECT_EQ(config.channelCapacity, 16u);
  EXPECT_EQ(config.transferCommand.size(), 4u);
  EXPECT_EQ(config.forceArguments.size(), 2u);
  EXPECT_EQ(config.fstatCommand[1], "{prefix}");
  EXPECT_EQ(config.headCommand.size(), 2u);
  EXPECT_TRUE(config.caseInsensitive);
  EXPECT_FALSE(config.haveList);
  EXPECT_TRUE(config.trustHaveList);
  EXPECT_EQ(config.progressInterval, 10u);
  EXPECT_EQ(config.localCacheEntries, 0u);
  EXPECT_EQ(config.serverHost, "127.0.0.1");
  EXPECT_EQ(config.serverPort, 9000);
  EXPECT_EQ(config.cacheDb, "/var/cache/depotsync.db");
  EXPECT_EQ(config.spoolDir, "/var/spool/depotsync");
  EXPECT_EQ(config.ingestPrefixes.size(), 2u);
  EXPECT_EQ(config.ingestIntervalSeconds, 30);
  EXPECT_EQ(config.maxEntriesPerPrefix, 100u);
}

TEST(ConfigTest, RejectsBadInput) {
  EXPECT_THROW(Config::parse("not json"), ConfigError);
  EXPECT_THROW(Config::parse("[1, 2]"), ConfigError);
  EXPECT_THROW(Config::parse(R"({"workers": 0})"), ConfigError);
  EXPECT_THROW(Config::parse(R"({"workers": -2})"), ConfigError);
  EXPECT_THROW(Config::parse(R"({"workers": "many"})"), ConfigError);
  EXPECT_THROW(Config::parse(R"({"server_port": 70000})"), ConfigError);
  EXPECT_THROW(Config::parse(R"({"service_url": 5})"), ConfigError);
  EXPECT_THROW(Config::parse(R"({"transfer_command": "p4 sync"})"),
               ConfigError);
}

TEST(ConfigTest, LoadsFromEnvironmentPath) {
  test::TempDir dir;
  auto path = dir.path() / "config.json";
  test::writeFile(path, R"({"depot_prefix": "//depot/env", "workers": 2})");

  ::setenv("DEPOTSYNC_CONFIG", path.c_str(), 1);
  auto config = Config::load();
  ::unsetenv("DEPOTSYNC_CONFIG");

  EXPECT_EQ(config.depotPrefix, "//depot/env");
  EXPECT_EQ(config.workers, 2u);
}

TEST(ConfigTest, MissingExplicitFileIsAnError) {
  EXPECT_THROW(Config::loadFile("/nonexistent/depotsync.json"), ConfigError);
}
