#ifndef CONFIG_HPP_
#define CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace remit {

enum class StorageBackend {
  MEMORY,
  POSTGRES
};

/**
 * Server settings. Every field has a default; a JSON document only needs the
 * keys it changes.
 */
struct ServerConfig {
  // Ten years; keeps the TTL representable in the session clock's nanoseconds.
  static constexpr int64_t kMaxSessionTtlSeconds = 10LL * 365 * 24 * 60 * 60;

  int port = 8080;
  observability::LogLevel log_level = observability::LogLevel::INFO;
  std::chrono::seconds session_ttl{0};
  StorageBackend storage = StorageBackend::MEMORY;
  bool seed_demo_users = true;
  std::chrono::seconds purge_interval{60};
  database::PostgresConnection::Config database;
  std::string schema_path;

  /**
   * Applies the keys present in `j` over the defaults. Throws
   * std::invalid_argument naming the offending key.
   */
  static ServerConfig fromJson(const nlohmann::json& j);

  /**
   * Reads and parses a JSON file. Throws std::runtime_error if the file
   * cannot be read, std::invalid_argument on bad content.
   */
  static ServerConfig loadFromFile(const std::string& path);

  /**
   * `remit_server [config.json] [port]`: the optional port overrides the file.
   */
  static ServerConfig fromCommandLine(int argc, char* argv[]);
};

}  // namespace remit

#endif  // CONFIG_HPP_
