#ifndef SESSION_MANAGER_HPP_
#define SESSION_MANAGER_HPP_

#include <array>
#include <chrono>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace remit {
namespace core {

/**
 * Process-local table of session tokens.
 * Tokens are spread over fixed shards, each guarded by its own shared_mutex,
 * so calls on tokens in different shards never contend. Nothing is persisted.
 */
class SessionManager {
 public:
  using Clock = std::chrono::system_clock;
  using ClockFn = std::function<Clock::time_point()>;
  using TokenSource = std::function<std::string()>;

  struct Config {
    // Zero disables expiry.
    std::chrono::seconds ttl{0};
  };

  explicit SessionManager(const Config& config);
  SessionManager(const Config& config, ClockFn clock, TokenSource token_source);

  // Non-copyable
  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  /**
   * Binds a fresh 256-bit random token to `username`.
   */
  std::string createSession(const std::string& username);

  /**
   * Returns the bound username. Throws ServiceError(Unauthorized) if the
   * token is unknown or expired. Does not extend the session lifetime.
   */
  std::string validate(const std::string& token);

  /**
   * Removes the token. Unknown tokens are ignored.
   */
  void invalidate(const std::string& token);

  /**
   * Drops every expired binding and returns how many were removed.
   */
  size_t purgeExpired();

  size_t activeCount() const;

 private:
  static constexpr size_t kShardCount = 16;

  struct Session {
    std::string username;
    Clock::time_point created_at;
  };

  struct Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, Session> sessions;
  };

  Shard& shardFor(const std::string& token);
  bool isExpired(const Session& session, Clock::time_point now) const;

  Config config_;
  ClockFn clock_;
  TokenSource token_source_;
  std::array<Shard, kShardCount> shards_;
};

}  // namespace core
}  // namespace remit

#endif  // SESSION_MANAGER_HPP_
