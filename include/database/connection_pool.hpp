#ifndef CONNECTION_POOL_HPP_
#define CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace remit {
namespace database {

/**
 * Bounded pool of PostgreSQL connections. Connections are opened lazily up
 * to max_connections and leased to one caller at a time.
 */
class ConnectionPool {
 public:
  /**
   * Exclusive use of one connection; returns it to the pool when destroyed.
   */
  class Lease {
   public:
    Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    PostgresConnection& operator*() { return *conn_; }
    PostgresConnection* operator->() { return conn_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<PostgresConnection> conn_;
  };

  explicit ConnectionPool(const PostgresConnection::Config& config,
                          std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5));

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Waits for a free connection. Throws StoreUnavailable on timeout or when a
   * new connection cannot be opened.
   */
  Lease acquire();

  size_t idleCount() const;

  const PostgresConnection::Config& config() const { return config_; }

 private:
  void release(std::unique_ptr<PostgresConnection> conn);

  PostgresConnection::Config config_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  size_t open_count_ = 0;
};

}  // namespace database
}  // namespace remit

#endif  // CONNECTION_POOL_HPP_
