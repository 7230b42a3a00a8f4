#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include <libpq-fe.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace remit {
namespace database {

using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

// Positional query parameters; nullopt binds SQL NULL.
using QueryParams = std::vector<std::optional<std::string>>;

/**
 * PostgreSQL database connection wrapper.
 * Not thread-safe: a connection is used by one thread at a time, which the
 * ConnectionPool guarantees by leasing it exclusively.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "remit";
    std::string username = "remit";
    std::string password = "";
    int connection_timeout = 10;  // seconds
    int max_connections = 8;
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Returns false and logs the libpq error on failure.
   */
  bool connect();

  void disconnect();

  bool isConnected() const;

  /**
   * Execute one or more statements without parameters. Throws
   * StoreUnavailable on failure.
   */
  ResultPtr execute(const std::string& sql);

  /**
   * Execute a parameterized statement. Parameters are sent as text. Throws
   * StoreUnavailable on failure.
   */
  ResultPtr executeParams(const std::string& sql, const QueryParams& params);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();
  // Also true while the server side still holds an open or aborted transaction.
  bool inTransaction() const {
    return in_transaction_ || (connection_ && PQtransactionStatus(connection_) != PQTRANS_IDLE);
  }

  std::string getLastError() const;

  /**
   * Connection info for logging (never includes the password).
   */
  std::string getConnectionInfo() const;

 private:
  ResultPtr checkResult(PGresult* raw, const std::string& sql);

  Config config_;
  PGconn* connection_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back unless commit() succeeded.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Throws StoreUnavailable if COMMIT fails.
   */
  void commit();

  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace remit

#endif  // POSTGRES_CONNECTION_HPP_
