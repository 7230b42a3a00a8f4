#include "core/transfer_engine.hpp"
#include "core/audit.hpp"
#include "core/fee_calculator.hpp"
#include "crypto/secure_random.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <chrono>

namespace remit {
namespace core {

namespace {

Timestamp nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string newTransferId() {
  return "tr_" + crypto::randomHex(16);
}

}  // namespace

TransferEngine::TransferEngine(LedgerStore& store)
    : TransferEngine(store, nowSeconds, newTransferId) {
}

TransferEngine::TransferEngine(LedgerStore& store, ClockFn clock, IdSource id_source)
    : store_(store), clock_(std::move(clock)), id_source_(std::move(id_source)) {
}

TransferResult TransferEngine::submitTransfer(const std::string& acting_username,
                                              const std::string& to_username,
                                              const std::string& amount_text,
                                              const std::string& reference) {
  if (!store_.getUser(to_username)) {
    throw ServiceError(ErrorCode::UnknownRecipient, "Invalid recipient account");
  }
  if (acting_username == to_username) {
    throw ServiceError(ErrorCode::SelfTransferNotAllowed, "Recipient cannot be the sender");
  }

  auto amount = Money::parse(amount_text);
  if (!amount || !amount->isPositive()) {
    throw ServiceError(ErrorCode::InvalidAmount,
                       "Amount must be a positive decimal with at most two fraction digits");
  }

  const Money fee = FeeCalculator::fee(*amount);
  const Money total = *amount + fee;
  const Timestamp created_at = clock_();

  Transfer transfer;
  transfer.transfer_id = id_source_();
  transfer.from_user = acting_username;
  transfer.to_user = to_username;
  transfer.amount = *amount;
  transfer.fee = fee;
  transfer.reference = reference;
  transfer.status = TransferStatus::PENDING;
  transfer.created_at = created_at;
  transfer.updated_at = created_at;

  // Durable before any money moves, so a crash leaves an auditable PENDING row.
  store_.createTransfer(transfer);

  auto balance = store_.getBalance(acting_username);
  if (!balance) {
    return finalizeFailed(transfer, "AccountMissing", Money());
  }
  if (*balance < total) {
    return finalizeFailed(transfer, kInsufficientFunds, *balance);
  }

  ApplyResult applied;
  try {
    observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                                 "transfer_apply_seconds");
    applied = store_.applyTransfer(acting_username, to_username, total, *amount,
                                   transfer.transfer_id, clock_());
  } catch (const StoreUnavailable& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Atomic apply failed, transfer left PENDING")
        .field("transfer_id", transfer.transfer_id)
        .field("error", e.what());
    throw;
  }

  switch (applied.outcome) {
    case ApplyOutcome::COMMITTED:
      break;
    case ApplyOutcome::INSUFFICIENT_FUNDS:
      // A concurrent debit drained the sender between the check and the lock.
      return finalizeFailed(transfer, kInsufficientFunds, applied.from_balance);
    case ApplyOutcome::ACCOUNT_MISSING:
      return finalizeFailed(transfer, "AccountMissing", applied.from_balance);
    case ApplyOutcome::TRANSFER_NOT_PENDING:
    default:
      throw StoreUnavailable("Transfer " + transfer.transfer_id + " not applied: " +
                             applyOutcomeToString(applied.outcome));
  }

  observability::getGlobalMetrics().incrementCounter("transfers_completed_total");
  LOG_BUILDER(observability::LogLevel::INFO, "Transfer completed")
      .field("transfer_id", transfer.transfer_id)
      .field("from", acting_username)
      .field("to", to_username)
      .field("amount", amount->toString())
      .field("fee", fee.toString());
  audit("TRANSFER_COMPLETED", acting_username,
        "Transfer " + transfer.transfer_id + " to " + to_username + ": " +
            amount->toString() + " fee " + fee.toString());

  return TransferResult{transfer.transfer_id, fee, applied.from_balance,
                        TransferStatus::COMPLETED, ""};
}

Transfer TransferEngine::getTransferStatus(const std::string& acting_username,
                                           const std::string& transfer_id) {
  auto transfer = store_.getTransfer(transfer_id);
  if (!transfer) {
    throw ServiceError(ErrorCode::NotFound, "Transfer not found");
  }
  if (transfer->from_user != acting_username && transfer->to_user != acting_username) {
    throw ServiceError(ErrorCode::Forbidden, "Not a party to this transfer");
  }
  return *transfer;
}

std::vector<Transfer> TransferEngine::listTransfers(const std::string& acting_username,
                                                    size_t limit) {
  if (limit == 0) {
    throw ServiceError(ErrorCode::InvalidRequest, "List limit must be positive");
  }
  return store_.getTransfersByUser(acting_username, std::min(limit, kMaxListLimit));
}

TransferResult TransferEngine::finalizeFailed(const Transfer& transfer, const std::string& reason,
                                              Money sender_balance) {
  if (!store_.updateTransfer(transfer.transfer_id, TransferStatus::FAILED, reason, clock_())) {
    throw StoreUnavailable("Could not finalize transfer " + transfer.transfer_id);
  }

  observability::getGlobalMetrics().incrementCounter("transfers_failed_total");
  LOG_BUILDER(observability::LogLevel::INFO, "Transfer failed")
      .field("transfer_id", transfer.transfer_id)
      .field("from", transfer.from_user)
      .field("to", transfer.to_user)
      .field("reason", reason);
  audit("TRANSFER_FAILED", transfer.from_user,
        "Transfer " + transfer.transfer_id + " to " + transfer.to_user + ": " +
            transfer.amount.toString() + " failed: " + reason);

  return TransferResult{transfer.transfer_id, transfer.fee, sender_balance,
                        TransferStatus::FAILED, reason};
}

void TransferEngine::audit(const std::string& operation, const std::string& username,
                           const std::string& details) {
  emitAudit(store_, operation, username, details, clock_());
}

}  // namespace core
}  // namespace remit
