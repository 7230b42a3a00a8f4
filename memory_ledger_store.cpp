#include "memory_ledger_store.hpp"
#include "crypto/credential_hasher.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>

namespace remit {

MemoryLedgerStore::MemoryLedgerStore()
    : MemoryLedgerStore([] {
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
      }) {
}

MemoryLedgerStore::MemoryLedgerStore(ClockFn clock) : clock_(std::move(clock)) {
}

std::optional<User> MemoryLedgerStore::getUser(const std::string& username) {
  std::shared_lock<std::shared_mutex> lock(users_mutex_);
  auto it = users_.find(username);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second.user;
}

bool MemoryLedgerStore::verifyCredential(const std::string& username, const std::string& secret) {
  std::string verifier;
  {
    std::shared_lock<std::shared_mutex> lock(users_mutex_);
    auto it = users_.find(username);
    if (it == users_.end()) {
      return false;
    }
    verifier = it->second.verifier;
  }
  return crypto::CredentialHasher::verify(secret, verifier);
}

bool MemoryLedgerStore::createUser(const std::string& username, const std::string& secret,
                                   const std::string& email, Money initial_balance) {
  if (initial_balance.isNegative()) {
    return false;
  }
  // Hash outside the lock.
  std::string verifier = crypto::CredentialHasher::hash(secret);
  const Timestamp now = clock_();

  std::unique_lock<std::shared_mutex> lock(users_mutex_);
  if (users_.find(username) != users_.end()) {
    return false;
  }
  users_[username] = UserRecord{User{username, email, now}, std::move(verifier)};
  auto account = std::make_unique<Account>();
  account->balance = initial_balance;
  accounts_[username] = std::move(account);
  return true;
}

std::optional<Money> MemoryLedgerStore::getBalance(const std::string& username) {
  std::shared_lock<std::shared_mutex> users_lock(users_mutex_);
  auto it = accounts_.find(username);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> account_lock(it->second->mutex);
  return it->second->balance;
}

void MemoryLedgerStore::createTransfer(const Transfer& transfer) {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  if (!transfers_.emplace(transfer.transfer_id, transfer).second) {
    throw StoreUnavailable("Duplicate transfer id: " + transfer.transfer_id);
  }
  transfer_order_.push_back(transfer.transfer_id);
}

ApplyResult MemoryLedgerStore::applyTransfer(const std::string& from_user,
                                             const std::string& to_user,
                                             Money debit, Money credit,
                                             const std::string& transfer_id,
                                             Timestamp updated_at) {
  std::shared_lock<std::shared_mutex> users_lock(users_mutex_);

  auto from_it = accounts_.find(from_user);
  auto to_it = accounts_.find(to_user);
  if (from_it == accounts_.end() || to_it == accounts_.end()) {
    return ApplyResult{ApplyOutcome::ACCOUNT_MISSING, Money()};
  }
  Account& from = *from_it->second;
  Account& to = *to_it->second;

  // Acquire account locks in consistent order to prevent deadlocks.
  std::unique_lock<std::mutex> first_lock;
  std::unique_lock<std::mutex> second_lock;
  if (&from == &to) {
    first_lock = std::unique_lock<std::mutex>(from.mutex);
  } else if (from_user < to_user) {
    first_lock = std::unique_lock<std::mutex>(from.mutex);
    second_lock = std::unique_lock<std::mutex>(to.mutex);
  } else {
    first_lock = std::unique_lock<std::mutex>(to.mutex);
    second_lock = std::unique_lock<std::mutex>(from.mutex);
  }

  if (from.balance < debit) {
    return ApplyResult{ApplyOutcome::INSUFFICIENT_FUNDS, from.balance};
  }

  std::lock_guard<std::mutex> transfers_lock(transfers_mutex_);
  auto transfer_it = transfers_.find(transfer_id);
  if (transfer_it == transfers_.end() || isTerminal(transfer_it->second.status)) {
    return ApplyResult{ApplyOutcome::TRANSFER_NOT_PENDING, from.balance};
  }

  // Nothing below can fail, so the three writes land together.
  from.balance -= debit;
  to.balance += credit;
  Transfer& transfer = transfer_it->second;
  transfer.status = TransferStatus::COMPLETED;
  transfer.reason.clear();
  transfer.updated_at = std::max(transfer.updated_at, updated_at);
  return ApplyResult{ApplyOutcome::COMMITTED, from.balance};
}

std::optional<Transfer> MemoryLedgerStore::getTransfer(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryLedgerStore::updateTransfer(const std::string& transfer_id, TransferStatus status,
                                       const std::string& reason, Timestamp updated_at) {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end() || isTerminal(it->second.status)) {
    return false;
  }
  it->second.status = status;
  it->second.reason = status == TransferStatus::FAILED ? reason : "";
  it->second.updated_at = std::max(it->second.updated_at, updated_at);
  return true;
}

std::vector<Transfer> MemoryLedgerStore::getTransfersByUser(const std::string& username,
                                                            size_t limit) {
  std::vector<Transfer> result;
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  for (auto it = transfer_order_.rbegin();
       it != transfer_order_.rend() && result.size() < limit; ++it) {
    const Transfer& transfer = transfers_.at(*it);
    if (transfer.from_user == username || transfer.to_user == username) {
      result.push_back(transfer);
    }
  }
  return result;
}

void MemoryLedgerStore::appendAudit(const AuditLogEntry& entry) {
  std::lock_guard<std::mutex> lock(audit_mutex_);
  AuditLogEntry stored = entry;
  stored.log_id = next_log_id_++;
  audit_log_.push_back(std::move(stored));
}

std::vector<AuditLogEntry> MemoryLedgerStore::getAuditLogs(size_t limit) {
  std::lock_guard<std::mutex> lock(audit_mutex_);
  std::vector<AuditLogEntry> result;
  for (auto it = audit_log_.rbegin(); it != audit_log_.rend() && result.size() < limit; ++it) {
    result.push_back(*it);
  }
  return result;
}

HealthStatus MemoryLedgerStore::healthCheck() {
  std::shared_lock<std::shared_mutex> lock(users_mutex_);
  return HealthStatus{true, "memory store, " + std::to_string(accounts_.size()) + " accounts"};
}

Money MemoryLedgerStore::totalBalance() {
  std::shared_lock<std::shared_mutex> users_lock(users_mutex_);
  Money total;
  for (auto& [username, account] : accounts_) {
    std::lock_guard<std::mutex> account_lock(account->mutex);
    total += account->balance;
  }
  return total;
}

std::unique_lock<std::mutex> MemoryLedgerStore::lockAccount(const std::string& username) {
  std::shared_lock<std::shared_mutex> users_lock(users_mutex_);
  auto it = accounts_.find(username);
  if (it == accounts_.end()) {
    throw ServiceError(ErrorCode::NotFound, "Account not found: " + username);
  }
  // Accounts are never erased, so the mutex outlives the map lock.
  return std::unique_lock<std::mutex>(it->second->mutex);
}

}  // namespace remit
