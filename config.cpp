#include "config.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace remit {

namespace {

template <typename T>
T read(const nlohmann::json& j, const std::string& key, const T& fallback) {
  auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception&) {
    throw std::invalid_argument("Invalid value for config key: " + key);
  }
}

int readPort(const nlohmann::json& j, const std::string& key, int fallback) {
  const int port = read<int>(j, key, fallback);
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("Invalid value for config key: " + key);
  }
  return port;
}

int readPositive(const nlohmann::json& j, const std::string& key, int fallback) {
  const int value = read<int>(j, key, fallback);
  if (value <= 0) {
    throw std::invalid_argument("Invalid value for config key: " + key);
  }
  return value;
}

}  // namespace

ServerConfig ServerConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("Config must be a JSON object");
  }

  ServerConfig config;
  config.port = readPort(j, "port", config.port);

  if (j.contains("log_level")) {
    auto level = observability::logLevelFromString(read<std::string>(j, "log_level", ""));
    if (!level) {
      throw std::invalid_argument("Invalid value for config key: log_level");
    }
    config.log_level = *level;
  }

  const int64_t ttl = read<int64_t>(j, "session_ttl_seconds", 0);
  if (ttl < 0 || ttl > kMaxSessionTtlSeconds) {
    throw std::invalid_argument("Invalid value for config key: session_ttl_seconds");
  }
  config.session_ttl = std::chrono::seconds(ttl);

  if (j.contains("storage")) {
    const std::string storage = read<std::string>(j, "storage", "");
    if (storage == "memory") {
      config.storage = StorageBackend::MEMORY;
    } else if (storage == "postgres") {
      config.storage = StorageBackend::POSTGRES;
    } else {
      throw std::invalid_argument("Invalid value for config key: storage");
    }
  }

  config.seed_demo_users = read<bool>(j, "seed_demo_users", config.seed_demo_users);
  config.purge_interval = std::chrono::seconds(
      readPositive(j, "purge_interval_seconds", static_cast<int>(config.purge_interval.count())));

  if (j.contains("database")) {
    const nlohmann::json& db = j["database"];
    if (!db.is_object()) {
      throw std::invalid_argument("Invalid value for config key: database");
    }
    auto& out = config.database;
    out.host = read<std::string>(db, "host", out.host);
    out.port = readPort(db, "port", out.port);
    out.database = read<std::string>(db, "name", out.database);
    out.username = read<std::string>(db, "username", out.username);
    out.password = read<std::string>(db, "password", out.password);
    out.connection_timeout = readPositive(db, "connection_timeout", out.connection_timeout);
    out.max_connections = readPositive(db, "max_connections", out.max_connections);
    config.schema_path = read<std::string>(db, "schema_path", config.schema_path);
  }

  return config;
}

ServerConfig ServerConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("Config file is not valid JSON: " + std::string(e.what()));
  }
  return fromJson(j);
}

ServerConfig ServerConfig::fromCommandLine(int argc, char* argv[]) {
  ServerConfig config = argc >= 2 ? loadFromFile(argv[1]) : ServerConfig();
  if (argc >= 3) {
    int port = 0;
    try {
      port = std::stoi(argv[2]);
    } catch (const std::exception&) {
      throw std::invalid_argument("Invalid port argument: " + std::string(argv[2]));
    }
    config.port = readPort(nlohmann::json{{"port", port}}, "port", config.port);
  }
  return config;
}

}  // namespace remit
