#include "bank_service.hpp"
#include "core/audit.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <chrono>

namespace remit {

namespace {

Timestamp nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

BankService::BankService(LedgerStore& store, core::SessionManager& sessions,
                         core::TransferEngine& engine)
    : store_(store), sessions_(sessions), engine_(engine) {
}

std::string BankService::login(const std::string& username, const std::string& password) {
  if (username.empty() || !store_.verifyCredential(username, password)) {
    observability::getGlobalMetrics().incrementCounter("logins_failed_total");
    if (!username.empty()) {
      core::emitAudit(store_, "LOGIN_FAILED", username, "", nowSeconds());
    }
    LOG_BUILDER(observability::LogLevel::WARN, "Login rejected").field("username", username);
    throw ServiceError(ErrorCode::InvalidCredentials, "Invalid credentials");
  }

  std::string token = sessions_.createSession(username);
  observability::getGlobalMetrics().incrementCounter("logins_succeeded_total");
  core::emitAudit(store_, "LOGIN_SUCCESS", username, "", nowSeconds());
  LOG_BUILDER(observability::LogLevel::INFO, "Login succeeded").field("username", username);
  return token;
}

void BankService::logout(const std::string& token) {
  const std::string username = authenticate(token);
  sessions_.invalidate(token);
  core::emitAudit(store_, "LOGOUT", username, "", nowSeconds());
}

Money BankService::getBalance(const std::string& token) {
  const std::string username = authenticate(token);
  auto balance = store_.getBalance(username);
  if (!balance) {
    throw ServiceError(ErrorCode::NotFound, "Account not found");
  }
  return *balance;
}

TransferResult BankService::submitTransfer(const std::string& token, const std::string& recipient,
                                           const std::string& amount,
                                           const std::string& reference) {
  const std::string username = authenticate(token);
  return engine_.submitTransfer(username, recipient, amount, reference);
}

Transfer BankService::getTransferStatus(const std::string& token, const std::string& transfer_id) {
  const std::string username = authenticate(token);
  return engine_.getTransferStatus(username, transfer_id);
}

std::vector<Transfer> BankService::listTransfers(const std::string& token, size_t limit) {
  const std::string username = authenticate(token);
  return engine_.listTransfers(username, limit);
}

BankService::Health BankService::health() {
  Health result;
  try {
    result.store = store_.healthCheck();
  } catch (const StoreUnavailable& e) {
    result.store = HealthStatus{false, e.what()};
  }
  result.active_sessions = sessions_.activeCount();
  return result;
}

std::string BankService::authenticate(const std::string& token) {
  try {
    return sessions_.validate(token);
  } catch (const ServiceError&) {
    observability::getGlobalMetrics().incrementCounter("unauthorized_requests_total");
    throw;
  }
}

}  // namespace remit
