#include "database/postgres_ledger_store.hpp"
#include "crypto/credential_hasher.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

namespace remit {
namespace database {

namespace {

const char* const kTransferColumns = R"(
  transfer_id, from_user, to_user, amount::text, fee::text,
  COALESCE(reference, ''), status, COALESCE(reason, ''), created_at, updated_at
)";

Money moneyAt(PGresult* result, int row, int col) {
  auto value = Money::parse(PQgetvalue(result, row, col));
  if (!value) {
    throw StoreUnavailable(std::string("Malformed decimal in column ") + PQfname(result, col));
  }
  return *value;
}

Timestamp timestampAt(PGresult* result, int row, int col) {
  return std::stoll(PQgetvalue(result, row, col));
}

Transfer transferAt(PGresult* result, int row) {
  Transfer transfer;
  transfer.transfer_id = PQgetvalue(result, row, 0);
  transfer.from_user = PQgetvalue(result, row, 1);
  transfer.to_user = PQgetvalue(result, row, 2);
  transfer.amount = moneyAt(result, row, 3);
  transfer.fee = moneyAt(result, row, 4);
  transfer.reference = PQgetvalue(result, row, 5);
  auto status = transferStatusFromString(PQgetvalue(result, row, 6));
  if (!status) {
    throw StoreUnavailable("Unknown transfer status for " + transfer.transfer_id);
  }
  transfer.status = *status;
  transfer.reason = PQgetvalue(result, row, 7);
  transfer.created_at = timestampAt(result, row, 8);
  transfer.updated_at = timestampAt(result, row, 9);
  return transfer;
}

bool affectedRows(PGresult* result) {
  return std::string(PQcmdTuples(result)) != "0";
}

}  // namespace

PostgresLedgerStore::PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool)
    : PostgresLedgerStore(std::move(pool), [] {
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
      }) {
}

PostgresLedgerStore::PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool, ClockFn clock)
    : pool_(std::move(pool)), clock_(std::move(clock)) {
}

bool PostgresLedgerStore::initializeSchema(const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Could not open schema file")
        .field("path", schema_path);
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();

  // The simple query protocol accepts the whole script in one call.
  auto conn = pool_->acquire();
  conn->execute(buffer.str());

  LOG_BUILDER(observability::LogLevel::INFO, "Database schema applied").field("path", schema_path);
  return true;
}

std::optional<User> PostgresLedgerStore::getUser(const std::string& username) {
  auto conn = pool_->acquire();
  auto result = conn->executeParams(
      "SELECT username, COALESCE(email, ''), created_at FROM users WHERE username = $1",
      {username});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }

  User user;
  user.username = PQgetvalue(result.get(), 0, 0);
  user.email = PQgetvalue(result.get(), 0, 1);
  user.created_at = timestampAt(result.get(), 0, 2);
  return user;
}

bool PostgresLedgerStore::verifyCredential(const std::string& username, const std::string& secret) {
  std::string verifier;
  {
    auto conn = pool_->acquire();
    auto result = conn->executeParams("SELECT password_hash FROM users WHERE username = $1",
                                      {username});
    if (PQntuples(result.get()) == 0) {
      return false;
    }
    verifier = PQgetvalue(result.get(), 0, 0);
  }
  return crypto::CredentialHasher::verify(secret, verifier);
}

bool PostgresLedgerStore::createUser(const std::string& username, const std::string& secret,
                                     const std::string& email, Money initial_balance) {
  if (initial_balance.isNegative()) {
    return false;
  }
  const std::string verifier = crypto::CredentialHasher::hash(secret);
  const std::string now = std::to_string(clock_());

  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  auto inserted = conn->executeParams(R"(
      INSERT INTO users (username, password_hash, email, created_at)
      VALUES ($1, $2, $3, $4)
      ON CONFLICT (username) DO NOTHING
    )",
      {username, verifier, email.empty() ? std::nullopt : std::optional<std::string>(email), now});

  if (!affectedRows(inserted.get())) {
    transaction.rollback();
    return false;
  }

  conn->executeParams(
      "INSERT INTO accounts (username, balance, created_at) VALUES ($1, $2::numeric, $3)",
      {username, initial_balance.toString(), now});

  transaction.commit();
  return true;
}

std::optional<Money> PostgresLedgerStore::getBalance(const std::string& username) {
  auto conn = pool_->acquire();
  auto result = conn->executeParams("SELECT balance::text FROM accounts WHERE username = $1",
                                    {username});
  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return moneyAt(result.get(), 0, 0);
}

void PostgresLedgerStore::createTransfer(const Transfer& transfer) {
  auto conn = pool_->acquire();
  conn->executeParams(R"(
      INSERT INTO transfers (
        transfer_id, from_user, to_user, amount, fee,
        reference, status, reason, created_at, updated_at
      ) VALUES ($1, $2, $3, $4::numeric, $5::numeric, $6, $7, $8, $9, $10)
    )",
      {transfer.transfer_id,
       transfer.from_user,
       transfer.to_user,
       transfer.amount.toString(),
       transfer.fee.toString(),
       transfer.reference,
       transferStatusToString(transfer.status),
       transfer.reason.empty() ? std::nullopt : std::optional<std::string>(transfer.reason),
       std::to_string(transfer.created_at),
       std::to_string(transfer.updated_at)});
}

std::optional<Money> PostgresLedgerStore::lockBalance(PostgresConnection& conn,
                                                      const std::string& username) {
  auto result = conn.executeParams(
      "SELECT balance::text FROM accounts WHERE username = $1 FOR UPDATE", {username});
  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return moneyAt(result.get(), 0, 0);
}

ApplyResult PostgresLedgerStore::applyTransfer(const std::string& from_user,
                                               const std::string& to_user,
                                               Money debit, Money credit,
                                               const std::string& transfer_id,
                                               Timestamp updated_at) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  // Row locks in ascending username order.
  const std::string& first = std::min(from_user, to_user);
  const std::string& second = std::max(from_user, to_user);

  auto first_balance = lockBalance(*conn, first);
  auto second_balance = first == second ? first_balance : lockBalance(*conn, second);
  if (!first_balance || !second_balance) {
    return ApplyResult{ApplyOutcome::ACCOUNT_MISSING, Money()};
  }

  const Money from_balance = from_user == first ? *first_balance : *second_balance;
  if (from_balance < debit) {
    return ApplyResult{ApplyOutcome::INSUFFICIENT_FUNDS, from_balance};
  }

  conn->executeParams(
      "UPDATE accounts SET balance = balance - $2::numeric WHERE username = $1",
      {from_user, debit.toString()});
  conn->executeParams(
      "UPDATE accounts SET balance = balance + $2::numeric WHERE username = $1",
      {to_user, credit.toString()});

  auto finalized = conn->executeParams(R"(
      UPDATE transfers
      SET status = 'COMPLETED', reason = NULL, updated_at = GREATEST(updated_at, $2)
      WHERE transfer_id = $1 AND status = 'PENDING'
    )",
      {transfer_id, std::to_string(updated_at)});

  if (!affectedRows(finalized.get())) {
    return ApplyResult{ApplyOutcome::TRANSFER_NOT_PENDING, from_balance};
  }

  transaction.commit();
  return ApplyResult{ApplyOutcome::COMMITTED, from_balance - debit};
}

std::optional<Transfer> PostgresLedgerStore::getTransfer(const std::string& transfer_id) {
  auto conn = pool_->acquire();
  auto result = conn->executeParams(
      std::string("SELECT ") + kTransferColumns + " FROM transfers WHERE transfer_id = $1",
      {transfer_id});
  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return transferAt(result.get(), 0);
}

bool PostgresLedgerStore::updateTransfer(const std::string& transfer_id, TransferStatus status,
                                         const std::string& reason, Timestamp updated_at) {
  auto conn = pool_->acquire();
  const bool failed = status == TransferStatus::FAILED;
  auto result = conn->executeParams(R"(
      UPDATE transfers
      SET status = $2, reason = $3, updated_at = GREATEST(updated_at, $4)
      WHERE transfer_id = $1 AND status = 'PENDING'
    )",
      {transfer_id, transferStatusToString(status),
       failed ? std::optional<std::string>(reason) : std::nullopt,
       std::to_string(updated_at)});
  return affectedRows(result.get());
}

std::vector<Transfer> PostgresLedgerStore::getTransfersByUser(const std::string& username,
                                                              size_t limit) {
  auto conn = pool_->acquire();
  auto result = conn->executeParams(
      std::string("SELECT ") + kTransferColumns +
          " FROM transfers WHERE from_user = $1 OR to_user = $1"
          " ORDER BY created_at DESC, transfer_id LIMIT $2",
      {username, std::to_string(limit)});

  std::vector<Transfer> transfers;
  const int rows = PQntuples(result.get());
  transfers.reserve(rows);
  for (int i = 0; i < rows; ++i) {
    transfers.push_back(transferAt(result.get(), i));
  }
  return transfers;
}

void PostgresLedgerStore::appendAudit(const AuditLogEntry& entry) {
  auto conn = pool_->acquire();
  conn->executeParams(R"(
      INSERT INTO audit_logs (operation, username, details, timestamp)
      VALUES ($1, $2, $3, $4)
    )",
      {entry.operation,
       entry.username.empty() ? std::nullopt : std::optional<std::string>(entry.username),
       entry.details.empty() ? std::nullopt : std::optional<std::string>(entry.details),
       std::to_string(entry.timestamp)});
}

std::vector<AuditLogEntry> PostgresLedgerStore::getAuditLogs(size_t limit) {
  auto conn = pool_->acquire();
  auto result = conn->executeParams(R"(
      SELECT log_id, operation, COALESCE(username, ''), COALESCE(details, ''), timestamp
      FROM audit_logs
      ORDER BY log_id DESC
      LIMIT $1
    )",
      {std::to_string(limit)});

  std::vector<AuditLogEntry> entries;
  const int rows = PQntuples(result.get());
  for (int i = 0; i < rows; ++i) {
    AuditLogEntry entry;
    entry.log_id = std::stoll(PQgetvalue(result.get(), i, 0));
    entry.operation = PQgetvalue(result.get(), i, 1);
    entry.username = PQgetvalue(result.get(), i, 2);
    entry.details = PQgetvalue(result.get(), i, 3);
    entry.timestamp = timestampAt(result.get(), i, 4);
    entries.push_back(std::move(entry));
  }
  return entries;
}

HealthStatus PostgresLedgerStore::healthCheck() {
  try {
    auto conn = pool_->acquire();
    conn->execute("SELECT 1");
    return HealthStatus{true, "postgres " + conn->getConnectionInfo()};
  } catch (const StoreUnavailable& e) {
    return HealthStatus{false, e.what()};
  }
}

}  // namespace database
}  // namespace remit
