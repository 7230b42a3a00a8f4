#include "database/connection_pool.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"

namespace remit {
namespace database {

ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(&pool), conn_(std::move(conn)) {
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
}

ConnectionPool::Lease::~Lease() {
  if (conn_) {
    pool_->release(std::move(conn_));
  }
}

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config,
                               std::chrono::milliseconds acquire_timeout)
    : config_(config), acquire_timeout_(acquire_timeout) {
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  const size_t max_connections = config_.max_connections > 0
                                     ? static_cast<size_t>(config_.max_connections)
                                     : 1;

  bool ready = available_.wait_for(lock, acquire_timeout_, [&] {
    return !idle_.empty() || open_count_ < max_connections;
  });
  if (!ready) {
    throw StoreUnavailable("Timed out waiting for a database connection");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(*this, std::move(conn));
  }

  // Reserve the slot, then connect without holding the pool lock.
  ++open_count_;
  lock.unlock();

  auto conn = std::make_unique<PostgresConnection>(config_);
  if (!conn->connect()) {
    std::lock_guard<std::mutex> relock(mutex_);
    --open_count_;
    available_.notify_one();
    throw StoreUnavailable("Cannot connect to database " + conn->getConnectionInfo());
  }
  return Lease(*this, std::move(conn));
}

size_t ConnectionPool::idleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (conn->isConnected() && !conn->inTransaction()) {
    idle_.push_back(std::move(conn));
  } else {
    LOG_WARN("Discarding broken database connection");
    --open_count_;
  }
  available_.notify_one();
}

}  // namespace database
}  // namespace remit
