#ifndef RECORDS_HPP_
#define RECORDS_HPP_

#include "money.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace remit {

// Seconds since the Unix epoch.
using Timestamp = int64_t;

struct User {
  std::string username;
  std::string email;
  Timestamp created_at = 0;
};

enum class TransferStatus {
  PENDING,
  COMPLETED,
  FAILED
};

std::string transferStatusToString(TransferStatus status);
std::optional<TransferStatus> transferStatusFromString(const std::string& text);

inline bool isTerminal(TransferStatus status) {
  return status != TransferStatus::PENDING;
}

// Reason recorded on a transfer rejected for a short balance.
inline constexpr const char* kInsufficientFunds = "InsufficientFunds";

/**
 * One attempted money movement. amount and fee never change after creation;
 * status moves PENDING -> COMPLETED or PENDING -> FAILED exactly once.
 */
struct Transfer {
  std::string transfer_id;
  std::string from_user;
  std::string to_user;
  Money amount;
  Money fee;
  std::string reference;
  TransferStatus status = TransferStatus::PENDING;
  std::string reason;  // empty unless FAILED
  Timestamp created_at = 0;
  Timestamp updated_at = 0;
};

/**
 * What a caller learns from submitting a transfer.
 */
struct TransferResult {
  std::string transfer_id;
  Money fee;
  Money new_sender_balance;
  TransferStatus status = TransferStatus::PENDING;
  std::string reason;
};

struct AuditLogEntry {
  int64_t log_id = 0;  // assigned by the store
  std::string operation;
  std::string username;
  std::string details;
  Timestamp timestamp = 0;
};

struct HealthStatus {
  bool ok = false;
  std::string detail;
};

}  // namespace remit

#endif  // RECORDS_HPP_
