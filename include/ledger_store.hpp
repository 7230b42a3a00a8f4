#ifndef LEDGER_STORE_HPP_
#define LEDGER_STORE_HPP_

#include "records.hpp"

#include <optional>
#include <string>
#include <vector>

namespace remit {

/**
 * Result of the atomic apply step. Anything other than COMMITTED means the
 * store changed nothing.
 */
enum class ApplyOutcome {
  COMMITTED,
  INSUFFICIENT_FUNDS,
  ACCOUNT_MISSING,
  TRANSFER_NOT_PENDING
};

std::string applyOutcomeToString(ApplyOutcome outcome);

struct ApplyResult {
  ApplyOutcome outcome = ApplyOutcome::ACCOUNT_MISSING;
  // Sender balance after the commit, or the balance that caused the rejection.
  Money from_balance;
};

/**
 * Abstract base class for the data tier.
 * Owns users, balances, transfer records and the audit log. Implementations
 * throw StoreUnavailable when the backing store cannot serve a call.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  virtual std::optional<User> getUser(const std::string& username) = 0;

  /**
   * True only when the user exists and `secret` matches its stored verifier.
   */
  virtual bool verifyCredential(const std::string& username, const std::string& secret) = 0;

  /**
   * Creates the user together with its account. Returns false if the username
   * is taken.
   */
  virtual bool createUser(const std::string& username, const std::string& secret,
                          const std::string& email, Money initial_balance = Money()) = 0;

  virtual std::optional<Money> getBalance(const std::string& username) = 0;

  /**
   * Persists a new transfer record. Throws StoreUnavailable if the id exists.
   */
  virtual void createTransfer(const Transfer& transfer) = 0;

  /**
   * Atomically debits `from_user` by `debit`, credits `to_user` by `credit` and
   * moves the PENDING transfer `transfer_id` to COMPLETED. Account rows are
   * locked in ascending username order. Either all three changes become
   * visible together or none do.
   */
  virtual ApplyResult applyTransfer(const std::string& from_user, const std::string& to_user,
                                    Money debit, Money credit,
                                    const std::string& transfer_id, Timestamp updated_at) = 0;

  virtual std::optional<Transfer> getTransfer(const std::string& transfer_id) = 0;

  /**
   * Sets status and reason of a PENDING transfer. Returns false when the
   * transfer is unknown or already terminal.
   */
  virtual bool updateTransfer(const std::string& transfer_id, TransferStatus status,
                              const std::string& reason, Timestamp updated_at) = 0;

  /**
   * Transfers sent or received by `username`, newest first, at most `limit`.
   */
  virtual std::vector<Transfer> getTransfersByUser(const std::string& username,
                                                   size_t limit = 100) = 0;

  virtual void appendAudit(const AuditLogEntry& entry) = 0;

  /**
   * Most recent audit entries, newest first.
   */
  virtual std::vector<AuditLogEntry> getAuditLogs(size_t limit = 100) = 0;

  virtual HealthStatus healthCheck() = 0;
};

}  // namespace remit

#endif  // LEDGER_STORE_HPP_
