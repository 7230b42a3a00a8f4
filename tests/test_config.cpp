#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using remit::ServerConfig;
using remit::StorageBackend;

TEST(ServerConfigTest, DefaultsApplyToEmptyObject) {
  auto config = ServerConfig::fromJson(nlohmann::json::object());
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.storage, StorageBackend::MEMORY);
  EXPECT_EQ(config.session_ttl.count(), 0);
  EXPECT_TRUE(config.seed_demo_users);
  EXPECT_EQ(config.log_level, remit::observability::LogLevel::INFO);
  EXPECT_EQ(config.database.port, 5432);
}

TEST(ServerConfigTest, ReadsEveryKey) {
  auto config = ServerConfig::fromJson(nlohmann::json::parse(R"({
    "port": 9100,
    "log_level": "debug",
    "session_ttl_seconds": 900,
    "storage": "postgres",
    "seed_demo_users": false,
    "purge_interval_seconds": 5,
    "database": {
      "host": "db.internal",
      "port": 6432,
      "name": "ledger",
      "username": "svc",
      "password": "secret",
      "connection_timeout": 3,
      "max_connections": 16,
      "schema_path": "database/schema.sql"
    }
  })"));

  EXPECT_EQ(config.port, 9100);
  EXPECT_EQ(config.log_level, remit::observability::LogLevel::DEBUG);
  EXPECT_EQ(config.session_ttl.count(), 900);
  EXPECT_EQ(config.storage, StorageBackend::POSTGRES);
  EXPECT_FALSE(config.seed_demo_users);
  EXPECT_EQ(config.purge_interval.count(), 5);
  EXPECT_EQ(config.database.host, "db.internal");
  EXPECT_EQ(config.database.port, 6432);
  EXPECT_EQ(config.database.database, "ledger");
  EXPECT_EQ(config.database.username, "svc");
  EXPECT_EQ(config.database.password, "secret");
  EXPECT_EQ(config.database.connection_timeout, 3);
  EXPECT_EQ(config.database.max_connections, 16);
  EXPECT_EQ(config.schema_path, "database/schema.sql");
}

TEST(ServerConfigTest, RejectsBadValuesNamingTheKey) {
  auto expectRejected = [](const std::string& text, const std::string& key) {
    try {
      ServerConfig::fromJson(nlohmann::json::parse(text));
      FAIL() << "expected rejection of " << text;
    } catch (const std::invalid_argument& e) {
      EXPECT_NE(std::string(e.what()).find(key), std::string::npos) << e.what();
    }
  };

  expectRejected(R"({"storage": "redis"})", "storage");
  expectRejected(R"({"log_level": "verbose"})", "log_level");
  expectRejected(R"({"port": 70000})", "port");
  expectRejected(R"({"port": "eighty"})", "port");
  expectRejected(R"({"session_ttl_seconds": -1})", "session_ttl_seconds");
  expectRejected(R"({"database": {"max_connections": 0}})", "max_connections");
  expectRejected(R"({"database": []})", "database");
  EXPECT_THROW(ServerConfig::fromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST(ServerConfigTest, SessionTtlIsCappedBeforeClockOverflow) {
  nlohmann::json at_cap = {{"session_ttl_seconds", ServerConfig::kMaxSessionTtlSeconds}};
  EXPECT_EQ(ServerConfig::fromJson(at_cap).session_ttl.count(),
            ServerConfig::kMaxSessionTtlSeconds);

  nlohmann::json over_cap = {{"session_ttl_seconds", ServerConfig::kMaxSessionTtlSeconds + 1}};
  EXPECT_THROW(ServerConfig::fromJson(over_cap), std::invalid_argument);

  // Past this many seconds the TTL no longer fits in int64 nanoseconds.
  nlohmann::json overflowing = nlohmann::json::parse(R"({"session_ttl_seconds": 9300000000})");
  EXPECT_THROW(ServerConfig::fromJson(overflowing), std::invalid_argument);
}

TEST(ServerConfigTest, LoadsFileAndAppliesPortOverride) {
  const std::string path = ::testing::TempDir() + "remit_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"port": 9000, "session_ttl_seconds": 60})";
  }

  std::string program = "remit_server";
  std::string port = "9555";
  char* argv[] = {program.data(), const_cast<char*>(path.c_str()), port.data()};

  auto from_file = ServerConfig::fromCommandLine(2, argv);
  EXPECT_EQ(from_file.port, 9000);
  EXPECT_EQ(from_file.session_ttl.count(), 60);

  auto overridden = ServerConfig::fromCommandLine(3, argv);
  EXPECT_EQ(overridden.port, 9555);

  std::remove(path.c_str());
}

TEST(ServerConfigTest, MissingFileThrows) {
  EXPECT_THROW(ServerConfig::loadFromFile("/nonexistent/remit.json"), std::runtime_error);
}
