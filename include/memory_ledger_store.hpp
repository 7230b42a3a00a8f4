#ifndef MEMORY_LEDGER_STORE_HPP_
#define MEMORY_LEDGER_STORE_HPP_

#include "ledger_store.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace remit {

/**
 * Ledger store kept entirely in process memory.
 * Each account has its own mutex; applyTransfer takes the two account locks
 * in ascending username order, so transfers over disjoint accounts run in
 * parallel and opposite-direction transfers cannot deadlock.
 */
class MemoryLedgerStore : public LedgerStore {
 public:
  using ClockFn = std::function<Timestamp()>;

  MemoryLedgerStore();
  explicit MemoryLedgerStore(ClockFn clock);
  ~MemoryLedgerStore() override = default;

  // Non-copyable
  MemoryLedgerStore(const MemoryLedgerStore&) = delete;
  MemoryLedgerStore& operator=(const MemoryLedgerStore&) = delete;

  std::optional<User> getUser(const std::string& username) override;
  bool verifyCredential(const std::string& username, const std::string& secret) override;
  bool createUser(const std::string& username, const std::string& secret,
                  const std::string& email, Money initial_balance = Money()) override;

  std::optional<Money> getBalance(const std::string& username) override;

  void createTransfer(const Transfer& transfer) override;
  ApplyResult applyTransfer(const std::string& from_user, const std::string& to_user,
                            Money debit, Money credit,
                            const std::string& transfer_id, Timestamp updated_at) override;
  std::optional<Transfer> getTransfer(const std::string& transfer_id) override;
  bool updateTransfer(const std::string& transfer_id, TransferStatus status,
                      const std::string& reason, Timestamp updated_at) override;
  std::vector<Transfer> getTransfersByUser(const std::string& username,
                                           size_t limit = 100) override;

  void appendAudit(const AuditLogEntry& entry) override;
  std::vector<AuditLogEntry> getAuditLogs(size_t limit = 100) override;

  HealthStatus healthCheck() override;

  /**
   * Sum of all account balances. Used to check conservation.
   */
  Money totalBalance();

  /**
   * Holds one account's balance lock until the returned lock is released.
   * Throws ServiceError(NotFound) for an unknown account.
   */
  std::unique_lock<std::mutex> lockAccount(const std::string& username);

 private:
  struct Account {
    std::mutex mutex;
    Money balance;
  };

  struct UserRecord {
    User user;
    std::string verifier;
  };

  ClockFn clock_;

  // Guards the shape of users_ and accounts_; balances are guarded per account.
  mutable std::shared_mutex users_mutex_;
  std::unordered_map<std::string, UserRecord> users_;
  std::unordered_map<std::string, std::unique_ptr<Account>> accounts_;

  std::mutex transfers_mutex_;
  std::unordered_map<std::string, Transfer> transfers_;
  std::vector<std::string> transfer_order_;  // creation order

  std::mutex audit_mutex_;
  std::vector<AuditLogEntry> audit_log_;
  int64_t next_log_id_ = 1;
};

}  // namespace remit

#endif  // MEMORY_LEDGER_STORE_HPP_
