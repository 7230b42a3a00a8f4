#ifndef PROTOCOL_HPP_
#define PROTOCOL_HPP_

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "errors.hpp"
#include "records.hpp"

namespace remit {
namespace network {
namespace protocol {

// Message types
enum class MessageType {
  LOGIN,
  LOGOUT,
  GET_BALANCE,
  SUBMIT_TRANSFER,
  GET_TRANSFER_STATUS,
  LIST_TRANSFERS,
  HEALTH_CHECK,
  METRICS,
  HEARTBEAT,
  UNKNOWN
};

NLOHMANN_JSON_SERIALIZE_ENUM(MessageType, {
  {MessageType::UNKNOWN, nullptr},
  {MessageType::LOGIN, "LOGIN"},
  {MessageType::LOGOUT, "LOGOUT"},
  {MessageType::GET_BALANCE, "GET_BALANCE"},
  {MessageType::SUBMIT_TRANSFER, "SUBMIT_TRANSFER"},
  {MessageType::GET_TRANSFER_STATUS, "GET_TRANSFER_STATUS"},
  {MessageType::LIST_TRANSFERS, "LIST_TRANSFERS"},
  {MessageType::HEALTH_CHECK, "HEALTH_CHECK"},
  {MessageType::METRICS, "METRICS"},
  {MessageType::HEARTBEAT, "HEARTBEAT"},
})

// Response status
enum class Status {
  SUCCESS,
  ERROR,
  INVALID_REQUEST,
  UNAUTHORIZED,
  INVALID_CREDENTIALS,
  UNKNOWN_RECIPIENT,
  SELF_TRANSFER_NOT_ALLOWED,
  INVALID_AMOUNT,
  NOT_FOUND,
  FORBIDDEN,
  STORE_UNAVAILABLE
};

NLOHMANN_JSON_SERIALIZE_ENUM(Status, {
  {Status::ERROR, "ERROR"},
  {Status::SUCCESS, "SUCCESS"},
  {Status::INVALID_REQUEST, "INVALID_REQUEST"},
  {Status::UNAUTHORIZED, "UNAUTHORIZED"},
  {Status::INVALID_CREDENTIALS, "INVALID_CREDENTIALS"},
  {Status::UNKNOWN_RECIPIENT, "UNKNOWN_RECIPIENT"},
  {Status::SELF_TRANSFER_NOT_ALLOWED, "SELF_TRANSFER_NOT_ALLOWED"},
  {Status::INVALID_AMOUNT, "INVALID_AMOUNT"},
  {Status::NOT_FOUND, "NOT_FOUND"},
  {Status::FORBIDDEN, "FORBIDDEN"},
  {Status::STORE_UNAVAILABLE, "STORE_UNAVAILABLE"},
})

Status statusForError(ErrorCode code);

// Request base structure
struct Request {
  MessageType type = MessageType::UNKNOWN;
  std::string request_id;
  std::string session_token;
  nlohmann::json payload = nlohmann::json::object();

  static Request login(const std::string& request_id, const std::string& username,
                       const std::string& password);

  static Request logout(const std::string& request_id, const std::string& session_token);

  static Request getBalance(const std::string& request_id, const std::string& session_token);

  static Request submitTransfer(const std::string& request_id,
                                const std::string& session_token,
                                const std::string& recipient,
                                const std::string& amount,
                                const std::string& reference = "");

  static Request getTransferStatus(const std::string& request_id,
                                   const std::string& session_token,
                                   const std::string& transfer_id);

  // limit 0 leaves the field out and the server default applies.
  static Request listTransfers(const std::string& request_id, const std::string& session_token,
                               size_t limit = 0);

  static Request healthCheck(const std::string& request_id);

  static Request metrics(const std::string& request_id);

  static Request heartbeat(const std::string& request_id);
};

// Response base structure
struct Response {
  Status status = Status::ERROR;
  std::string message;
  std::string request_id;
  nlohmann::json payload = nlohmann::json::object();

  static Response success(const std::string& message, const std::string& request_id,
                          const nlohmann::json& payload = nlohmann::json::object());

  static Response error(Status status, const std::string& message,
                        const std::string& request_id);

  static Response loggedIn(const std::string& session_token, const std::string& request_id);
  static Response balanceResult(Money balance, const std::string& request_id);
  static Response transferResult(const TransferResult& result, const std::string& request_id);
  static Response transferRecord(const Transfer& transfer, const std::string& request_id);
  static Response transferList(const std::vector<Transfer>& transfers,
                               const std::string& request_id);
};

nlohmann::json transferToJson(const Transfer& transfer);

// Serialization functions
std::string serializeRequest(const Request& request);
Request deserializeRequest(const std::string& json_str);

std::string serializeResponse(const Response& response);
Response deserializeResponse(const std::string& json_str);

// Message framing for TCP transport: 8 hex digits of body length, then the body.
class MessageFramer {
 public:
  static constexpr size_t kHeaderSize = 8;
  static constexpr size_t kMaxMessageSize = 1 << 20;

  static std::string frameMessage(const std::string& message);
  static std::string unframeMessage(const std::string& framed_message);
  static bool isCompleteMessage(const std::string& buffer);
  // Size of the body announced by the header; throws on a malformed header.
  static size_t messageSize(const std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace remit

#endif  // PROTOCOL_HPP_
