#ifndef POSTGRES_LEDGER_STORE_HPP_
#define POSTGRES_LEDGER_STORE_HPP_

#include "database/connection_pool.hpp"
#include "ledger_store.hpp"

#include <functional>
#include <memory>

namespace remit {
namespace database {

/**
 * LedgerStore backed by PostgreSQL. Balances and amounts are NUMERIC(20,2)
 * columns exchanged as decimal text. applyTransfer runs in one transaction
 * that row-locks both accounts with SELECT ... FOR UPDATE in username order.
 */
class PostgresLedgerStore : public LedgerStore {
 public:
  using ClockFn = std::function<Timestamp()>;

  explicit PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool);
  PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool, ClockFn clock);
  ~PostgresLedgerStore() override = default;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Applies the schema file. Returns false if the file cannot be read; throws
   * StoreUnavailable if a statement fails.
   */
  bool initializeSchema(const std::string& schema_path);

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

 private:
  std::optional<Money> lockBalance(PostgresConnection& conn, const std::string& username);

  std::shared_ptr<ConnectionPool> pool_;
  ClockFn clock_;
};

}  // namespace database
}  // namespace remit

#endif  // POSTGRES_LEDGER_STORE_HPP_
