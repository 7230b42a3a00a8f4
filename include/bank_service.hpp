#ifndef BANK_SERVICE_HPP_
#define BANK_SERVICE_HPP_

#include "core/session_manager.hpp"
#include "core/transfer_engine.hpp"
#include "ledger_store.hpp"

#include <string>
#include <vector>

namespace remit {

/**
 * Customer-facing operations. Every token-taking call authenticates first and
 * throws ServiceError(Unauthorized) before touching any business rule.
 */
class BankService {
 public:
  struct Health {
    HealthStatus store;
    size_t active_sessions = 0;
  };

  BankService(LedgerStore& store, core::SessionManager& sessions, core::TransferEngine& engine);

  // Non-copyable
  BankService(const BankService&) = delete;
  BankService& operator=(const BankService&) = delete;

  /**
   * Returns a new session token. Unknown users and wrong passwords fail with
   * the same InvalidCredentials message.
   */
  std::string login(const std::string& username, const std::string& password);

  void logout(const std::string& token);

  Money getBalance(const std::string& token);

  TransferResult submitTransfer(const std::string& token, const std::string& recipient,
                                const std::string& amount, const std::string& reference);

  Transfer getTransferStatus(const std::string& token, const std::string& transfer_id);

  std::vector<Transfer> listTransfers(const std::string& token,
                                      size_t limit = core::TransferEngine::kDefaultListLimit);

  Health health();

  /**
   * Returns the session's username or throws ServiceError(Unauthorized).
   */
  std::string authenticate(const std::string& token);

 private:

  LedgerStore& store_;
  core::SessionManager& sessions_;
  core::TransferEngine& engine_;
};

}  // namespace remit

#endif  // BANK_SERVICE_HPP_
