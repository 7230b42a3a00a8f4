#include "core/session_manager.hpp"
#include "crypto/secure_random.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"

#include <mutex>

namespace remit {
namespace core {

namespace {

constexpr size_t kTokenBytes = 32;

std::string tokenPrefix(const std::string& token) {
  return token.substr(0, 8);
}

}  // namespace

SessionManager::SessionManager(const Config& config)
    : SessionManager(config, [] { return Clock::now(); },
                     [] { return crypto::randomHex(kTokenBytes); }) {
}

SessionManager::SessionManager(const Config& config, ClockFn clock, TokenSource token_source)
    : config_(config), clock_(std::move(clock)), token_source_(std::move(token_source)) {
}

std::string SessionManager::createSession(const std::string& username) {
  std::string token = token_source_();
  Shard& shard = shardFor(token);
  {
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    shard.sessions[token] = Session{username, clock_()};
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Session created")
      .field("username", username)
      .field("token_prefix", tokenPrefix(token));
  return token;
}

std::string SessionManager::validate(const std::string& token) {
  Shard& shard = shardFor(token);
  const auto now = clock_();
  {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.sessions.find(token);
    if (it == shard.sessions.end()) {
      throw ServiceError(ErrorCode::Unauthorized, "Invalid or expired session token");
    }
    if (!isExpired(it->second, now)) {
      return it->second.username;
    }
  }

  // Expired: drop it under the exclusive lock, re-checking in case it was replaced.
  {
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.sessions.find(token);
    if (it != shard.sessions.end() && isExpired(it->second, now)) {
      shard.sessions.erase(it);
    }
  }
  LOG_BUILDER(observability::LogLevel::DEBUG, "Session expired")
      .field("token_prefix", tokenPrefix(token));
  throw ServiceError(ErrorCode::Unauthorized, "Invalid or expired session token");
}

void SessionManager::invalidate(const std::string& token) {
  Shard& shard = shardFor(token);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  shard.sessions.erase(token);
}

size_t SessionManager::purgeExpired() {
  if (config_.ttl.count() <= 0) return 0;

  const auto now = clock_();
  size_t removed = 0;
  for (auto& shard : shards_) {
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    for (auto it = shard.sessions.begin(); it != shard.sessions.end();) {
      if (isExpired(it->second, now)) {
        it = shard.sessions.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  return removed;
}

size_t SessionManager::activeCount() const {
  size_t count = 0;
  for (const auto& shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    count += shard.sessions.size();
  }
  return count;
}

SessionManager::Shard& SessionManager::shardFor(const std::string& token) {
  return shards_[std::hash<std::string>{}(token) % kShardCount];
}

bool SessionManager::isExpired(const Session& session, Clock::time_point now) const {
  if (config_.ttl.count() <= 0) return false;
  return now - session.created_at >= config_.ttl;
}

}  // namespace core
}  // namespace remit
