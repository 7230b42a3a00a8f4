#include "bank_server.hpp"
#include "bank_service.hpp"
#include "config.hpp"
#include "core/session_manager.hpp"
#include "core/transfer_engine.hpp"
#include "database/connection_pool.hpp"
#include "database/postgres_ledger_store.hpp"
#include "memory_ledger_store.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

void describeMetrics() {
  auto& metrics = remit::observability::getGlobalMetrics();
  metrics.describe("transfers_completed_total", "Transfers that reached COMPLETED");
  metrics.describe("transfers_failed_total", "Transfers that reached FAILED");
  metrics.describe("transfer_apply_seconds", "Latency of the atomic ledger apply step");
  metrics.describe("logins_succeeded_total", "Successful logins");
  metrics.describe("logins_failed_total", "Rejected logins");
  metrics.describe("unauthorized_requests_total", "Calls rejected for a bad session token");
  metrics.describe("active_connections", "Open client connections");
}

std::unique_ptr<remit::LedgerStore> buildStore(const remit::ServerConfig& config) {
  if (config.storage == remit::StorageBackend::MEMORY) {
    LOG_INFO("Using in-memory ledger store");
    return std::make_unique<remit::MemoryLedgerStore>();
  }

  LOG_BUILDER(remit::observability::LogLevel::INFO, "Using PostgreSQL ledger store")
      .field("host", config.database.host)
      .field("port", config.database.port)
      .field("database", config.database.database)
      .field("max_connections", config.database.max_connections);

  auto pool = std::make_shared<remit::database::ConnectionPool>(config.database);
  auto store = std::make_unique<remit::database::PostgresLedgerStore>(pool);
  if (!config.schema_path.empty() && !store->initializeSchema(config.schema_path)) {
    throw std::runtime_error("Failed to apply schema from " + config.schema_path);
  }
  return store;
}

void seedDemoUsers(remit::LedgerStore& store) {
  struct DemoUser {
    const char* username;
    const char* password;
    const char* email;
    const char* balance;
  };
  const DemoUser users[] = {
      {"alice", "alice123", "alice@example.com", "50000.00"},
      {"bob", "bob123", "bob@example.com", "1000.00"},
  };

  for (const auto& user : users) {
    if (store.getUser(user.username)) {
      continue;
    }
    auto balance = remit::Money::parse(user.balance);
    if (balance && store.createUser(user.username, user.password, user.email, *balance)) {
      LOG_BUILDER(remit::observability::LogLevel::INFO, "Seeded demo user")
          .field("username", user.username)
          .field("balance", user.balance);
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    const remit::ServerConfig config = remit::ServerConfig::fromCommandLine(argc, argv);
    remit::observability::Logger::getInstance().setLogLevel(config.log_level);
    describeMetrics();

    auto store = buildStore(config);
    if (config.seed_demo_users) {
      seedDemoUsers(*store);
    }

    remit::core::SessionManager::Config session_config;
    session_config.ttl = config.session_ttl;
    remit::core::SessionManager sessions(session_config);
    remit::core::TransferEngine engine(*store);
    remit::BankService service(*store, sessions, engine);
    remit::BankServer server(config.port, service);

    if (!server.start()) {
      LOG_FATAL("Failed to start remittance server");
      return 1;
    }

    auto last_purge = std::chrono::steady_clock::now();
    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));

      if (std::chrono::steady_clock::now() - last_purge >= config.purge_interval) {
        last_purge = std::chrono::steady_clock::now();
        const size_t purged = sessions.purgeExpired();
        if (purged > 0) {
          LOG_BUILDER(remit::observability::LogLevel::INFO, "Purged expired sessions")
              .field("purged", purged)
              .field("active", sessions.activeCount());
        }
      }
    }

    LOG_INFO("Shutdown requested");
    server.stop();
  } catch (const std::exception& e) {
    LOG_BUILDER(remit::observability::LogLevel::FATAL, "Server error").field("error", e.what());
    return 1;
  }

  return 0;
}
