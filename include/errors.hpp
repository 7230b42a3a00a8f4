#ifndef ERRORS_HPP_
#define ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace remit {

/**
 * Caller-visible failure categories. InsufficientFunds is deliberately absent:
 * a short balance is reported as a FAILED transfer, not as an error.
 */
enum class ErrorCode {
  InvalidRequest,
  Unauthorized,
  InvalidCredentials,
  UnknownRecipient,
  SelfTransferNotAllowed,
  InvalidAmount,
  NotFound,
  Forbidden,
  StoreUnavailable
};

std::string errorCodeToString(ErrorCode code);

/**
 * Exception carrying an ErrorCode. Thrown by the service layer and mapped to a
 * wire status by the server.
 */
class ServiceError : public std::runtime_error {
 public:
  ServiceError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/**
 * The data tier could not be reached or aborted a transaction.
 */
class StoreUnavailable : public ServiceError {
 public:
  explicit StoreUnavailable(const std::string& message)
      : ServiceError(ErrorCode::StoreUnavailable, message) {}
};

}  // namespace remit

#endif  // ERRORS_HPP_
