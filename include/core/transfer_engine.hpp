#ifndef TRANSFER_ENGINE_HPP_
#define TRANSFER_ENGINE_HPP_

#include "ledger_store.hpp"
#include "records.hpp"

#include <functional>
#include <string>
#include <vector>

namespace remit {
namespace core {

/**
 * Validates transfers, computes fees and drives the transfer record from
 * PENDING to a terminal status through the ledger store. The only component
 * that moves money.
 */
class TransferEngine {
 public:
  using ClockFn = std::function<Timestamp()>;
  using IdSource = std::function<std::string()>;

  static constexpr size_t kDefaultListLimit = 100;
  static constexpr size_t kMaxListLimit = 1000;

  explicit TransferEngine(LedgerStore& store);
  TransferEngine(LedgerStore& store, ClockFn clock, IdSource id_source);

  // Non-copyable
  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  /**
   * Moves `amount_text` from `acting_username` to `to_username`.
   *
   * Checks run in order and the first failure wins: unknown recipient,
   * self-transfer, invalid amount. Those throw ServiceError and leave no
   * record. A short balance is not an error: the transfer is recorded as
   * FAILED with reason InsufficientFunds and returned. Throws
   * StoreUnavailable if the store fails; a transfer that reached the store
   * before the failure stays PENDING.
   */
  TransferResult submitTransfer(const std::string& acting_username,
                                const std::string& to_username,
                                const std::string& amount_text,
                                const std::string& reference);

  /**
   * Throws ServiceError(NotFound) for unknown ids and ServiceError(Forbidden)
   * when `acting_username` is neither sender nor recipient.
   */
  Transfer getTransferStatus(const std::string& acting_username, const std::string& transfer_id);

  /**
   * Newest first. `limit` above kMaxListLimit is clamped; zero throws
   * ServiceError(InvalidRequest).
   */
  std::vector<Transfer> listTransfers(const std::string& acting_username,
                                      size_t limit = kDefaultListLimit);

 private:
  TransferResult finalizeFailed(const Transfer& transfer, const std::string& reason,
                                Money sender_balance);
  void audit(const std::string& operation, const std::string& username,
             const std::string& details);

  LedgerStore& store_;
  ClockFn clock_;
  IdSource id_source_;
};

}  // namespace core
}  // namespace remit

#endif  // TRANSFER_ENGINE_HPP_
