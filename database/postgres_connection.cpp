#include "database/postgres_connection.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"

#include <sstream>

namespace remit {
namespace database {

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  if (connection_) {
    disconnect();
  }

  const std::string port = std::to_string(config_.port);
  const std::string timeout = std::to_string(config_.connection_timeout);
  const char* keywords[] = {"host", "port", "dbname", "user", "password",
                            "connect_timeout", "application_name", nullptr};
  const char* values[] = {config_.host.c_str(), port.c_str(), config_.database.c_str(),
                          config_.username.c_str(), config_.password.c_str(),
                          timeout.c_str(), "remit", nullptr};

  connection_ = PQconnectdbParams(keywords, values, 0);

  if (PQstatus(connection_) != CONNECTION_OK) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Database connection failed")
        .field("target", getConnectionInfo())
        .field("error", getLastError());
    disconnect();
    return false;
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Connected to PostgreSQL")
      .field("target", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  if (connection_) {
    if (in_transaction_) {
      rollbackTransaction();
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
  in_transaction_ = false;
}

bool PostgresConnection::isConnected() const {
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

ResultPtr PostgresConnection::execute(const std::string& sql) {
  if (!connection_) {
    throw StoreUnavailable("Not connected to database");
  }
  return checkResult(PQexec(connection_, sql.c_str()), sql);
}

ResultPtr PostgresConnection::executeParams(const std::string& sql, const QueryParams& params) {
  if (!connection_) {
    throw StoreUnavailable("Not connected to database");
  }

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PGresult* raw = PQexecParams(connection_, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0);
  return checkResult(raw, sql);
}

ResultPtr PostgresConnection::checkResult(PGresult* raw, const std::string& sql) {
  ResultPtr result(raw, &PQclear);
  if (!result) {
    throw StoreUnavailable("Query execution failed: " + getLastError());
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    std::string message = PQresultErrorMessage(result.get());
    LOG_BUILDER(observability::LogLevel::ERROR, "Query failed")
        .field("statement", sql.substr(0, 120))
        .field("error", message);
    throw StoreUnavailable("Query failed: " + message);
  }
  return result;
}

bool PostgresConnection::beginTransaction() {
  try {
    execute("BEGIN");
  } catch (const StoreUnavailable&) {
    return false;
  }
  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  if (!in_transaction_) {
    return false;
  }
  in_transaction_ = false;
  try {
    execute("COMMIT");
  } catch (const StoreUnavailable&) {
    return false;
  }
  return true;
}

bool PostgresConnection::rollbackTransaction() {
  if (!in_transaction_) {
    return false;
  }
  in_transaction_ = false;
  try {
    execute("ROLLBACK");
  } catch (const StoreUnavailable&) {
    return false;
  }
  return true;
}

std::string PostgresConnection::getLastError() const {
  if (!connection_) {
    return "Not connected";
  }
  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw StoreUnavailable("Failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  rollback();
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  if (!conn_.commitTransaction()) {
    throw StoreUnavailable("Failed to commit transaction: " + conn_.getLastError());
  }
}

void TransactionGuard::rollback() {
  if (finished_) return;
  finished_ = true;
  if (!conn_.rollbackTransaction()) {
    // The pool discards the connection if it is left unusable.
    LOG_WARN("Transaction rollback failed");
  }
}

}  // namespace database
}  // namespace remit
