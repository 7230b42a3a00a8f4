#include "records.hpp"

namespace remit {

std::string transferStatusToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::PENDING: return "PENDING";
    case TransferStatus::COMPLETED: return "COMPLETED";
    case TransferStatus::FAILED: return "FAILED";
    default: return "UNKNOWN";
  }
}

std::optional<TransferStatus> transferStatusFromString(const std::string& text) {
  if (text == "PENDING") return TransferStatus::PENDING;
  if (text == "COMPLETED") return TransferStatus::COMPLETED;
  if (text == "FAILED") return TransferStatus::FAILED;
  return std::nullopt;
}

}  // namespace remit
