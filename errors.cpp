#include "errors.hpp"

namespace remit {

std::string errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidRequest: return "InvalidRequest";
    case ErrorCode::Unauthorized: return "Unauthorized";
    case ErrorCode::InvalidCredentials: return "InvalidCredentials";
    case ErrorCode::UnknownRecipient: return "UnknownRecipient";
    case ErrorCode::SelfTransferNotAllowed: return "SelfTransferNotAllowed";
    case ErrorCode::InvalidAmount: return "InvalidAmount";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::Forbidden: return "Forbidden";
    case ErrorCode::StoreUnavailable: return "StoreUnavailable";
    default: return "Unknown";
  }
}

}  // namespace remit
