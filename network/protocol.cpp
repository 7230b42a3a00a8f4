#include "network/protocol.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace remit {
namespace network {
namespace protocol {

Status statusForError(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidRequest: return Status::INVALID_REQUEST;
    case ErrorCode::Unauthorized: return Status::UNAUTHORIZED;
    case ErrorCode::InvalidCredentials: return Status::INVALID_CREDENTIALS;
    case ErrorCode::UnknownRecipient: return Status::UNKNOWN_RECIPIENT;
    case ErrorCode::SelfTransferNotAllowed: return Status::SELF_TRANSFER_NOT_ALLOWED;
    case ErrorCode::InvalidAmount: return Status::INVALID_AMOUNT;
    case ErrorCode::NotFound: return Status::NOT_FOUND;
    case ErrorCode::Forbidden: return Status::FORBIDDEN;
    case ErrorCode::StoreUnavailable: return Status::STORE_UNAVAILABLE;
  }
  return Status::ERROR;
}

// Request helper methods
Request Request::login(const std::string& request_id, const std::string& username,
                       const std::string& password) {
  Request req;
  req.type = MessageType::LOGIN;
  req.request_id = request_id;
  req.payload["username"] = username;
  req.payload["password"] = password;
  return req;
}

Request Request::logout(const std::string& request_id, const std::string& session_token) {
  Request req;
  req.type = MessageType::LOGOUT;
  req.request_id = request_id;
  req.session_token = session_token;
  return req;
}

Request Request::getBalance(const std::string& request_id, const std::string& session_token) {
  Request req;
  req.type = MessageType::GET_BALANCE;
  req.request_id = request_id;
  req.session_token = session_token;
  return req;
}

Request Request::submitTransfer(const std::string& request_id,
                                const std::string& session_token,
                                const std::string& recipient,
                                const std::string& amount,
                                const std::string& reference) {
  Request req;
  req.type = MessageType::SUBMIT_TRANSFER;
  req.request_id = request_id;
  req.session_token = session_token;
  req.payload["recipient"] = recipient;
  req.payload["amount"] = amount;
  req.payload["reference"] = reference;
  return req;
}

Request Request::getTransferStatus(const std::string& request_id,
                                   const std::string& session_token,
                                   const std::string& transfer_id) {
  Request req;
  req.type = MessageType::GET_TRANSFER_STATUS;
  req.request_id = request_id;
  req.session_token = session_token;
  req.payload["transfer_id"] = transfer_id;
  return req;
}

Request Request::listTransfers(const std::string& request_id, const std::string& session_token,
                               size_t limit) {
  Request req;
  req.type = MessageType::LIST_TRANSFERS;
  req.request_id = request_id;
  req.session_token = session_token;
  if (limit > 0) {
    req.payload["limit"] = limit;
  }
  return req;
}

Request Request::healthCheck(const std::string& request_id) {
  Request req;
  req.type = MessageType::HEALTH_CHECK;
  req.request_id = request_id;
  return req;
}

Request Request::metrics(const std::string& request_id) {
  Request req;
  req.type = MessageType::METRICS;
  req.request_id = request_id;
  return req;
}

Request Request::heartbeat(const std::string& request_id) {
  Request req;
  req.type = MessageType::HEARTBEAT;
  req.request_id = request_id;
  return req;
}

// Response helper methods
Response Response::success(const std::string& message, const std::string& request_id,
                           const nlohmann::json& payload) {
  Response resp;
  resp.status = Status::SUCCESS;
  resp.message = message;
  resp.request_id = request_id;
  resp.payload = payload;
  return resp;
}

Response Response::error(Status status, const std::string& message,
                         const std::string& request_id) {
  Response resp;
  resp.status = status;
  resp.message = message;
  resp.request_id = request_id;
  return resp;
}

Response Response::loggedIn(const std::string& session_token, const std::string& request_id) {
  nlohmann::json payload;
  payload["session_token"] = session_token;
  return success("Login successful", request_id, payload);
}

Response Response::balanceResult(Money balance, const std::string& request_id) {
  nlohmann::json payload;
  payload["balance"] = balance.toString();
  return success("Balance retrieved", request_id, payload);
}

Response Response::transferResult(const TransferResult& result, const std::string& request_id) {
  nlohmann::json payload;
  payload["transfer_id"] = result.transfer_id;
  payload["fee"] = result.fee.toString();
  payload["new_balance"] = result.new_sender_balance.toString();
  payload["status"] = transferStatusToString(result.status);
  if (!result.reason.empty()) {
    payload["reason"] = result.reason;
  }
  const char* message = result.status == TransferStatus::COMPLETED ? "Transfer completed"
                                                                   : "Transfer failed";
  return success(message, request_id, payload);
}

Response Response::transferRecord(const Transfer& transfer, const std::string& request_id) {
  return success("Transfer retrieved", request_id, transferToJson(transfer));
}

Response Response::transferList(const std::vector<Transfer>& transfers,
                                const std::string& request_id) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& transfer : transfers) {
    items.push_back(transferToJson(transfer));
  }
  nlohmann::json payload;
  payload["transfers"] = std::move(items);
  return success("Transfers retrieved", request_id, payload);
}

nlohmann::json transferToJson(const Transfer& transfer) {
  nlohmann::json j;
  j["transfer_id"] = transfer.transfer_id;
  j["from_user"] = transfer.from_user;
  j["to_user"] = transfer.to_user;
  j["amount"] = transfer.amount.toString();
  j["fee"] = transfer.fee.toString();
  j["reference"] = transfer.reference;
  j["status"] = transferStatusToString(transfer.status);
  j["reason"] = transfer.reason;
  j["created_at"] = transfer.created_at;
  j["updated_at"] = transfer.updated_at;
  return j;
}

// Serialization functions
std::string serializeRequest(const Request& request) {
  nlohmann::json j;
  j["type"] = request.type;
  j["request_id"] = request.request_id;
  j["session_token"] = request.session_token;
  j["payload"] = request.payload;
  return j.dump();
}

Request deserializeRequest(const std::string& json_str) {
  nlohmann::json j = nlohmann::json::parse(json_str);
  if (!j.is_object()) {
    throw std::invalid_argument("Request must be a JSON object");
  }
  Request req;
  req.type = j.value("type", MessageType::UNKNOWN);
  req.request_id = j.value("request_id", std::string());
  req.session_token = j.value("session_token", std::string());
  if (j.contains("payload")) {
    req.payload = j["payload"];
  }
  if (!req.payload.is_object()) {
    throw std::invalid_argument("Request payload must be a JSON object");
  }
  return req;
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = response.status;
  j["message"] = response.message;
  j["request_id"] = response.request_id;
  j["payload"] = response.payload;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Response deserializeResponse(const std::string& json_str) {
  nlohmann::json j = nlohmann::json::parse(json_str);
  Response resp;
  resp.status = j.at("status").get<Status>();
  resp.message = j.value("message", std::string());
  resp.request_id = j.value("request_id", std::string());
  if (j.contains("payload")) {
    resp.payload = j["payload"];
  }
  return resp;
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& message) {
  if (message.size() > kMaxMessageSize) {
    throw std::length_error("Message exceeds maximum frame size");
  }
  std::stringstream ss;
  ss << std::setw(kHeaderSize) << std::setfill('0') << std::hex << message.size();
  ss << message;
  return ss.str();
}

size_t MessageFramer::messageSize(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) {
    throw std::runtime_error("Invalid framed message: too short");
  }
  size_t message_size = 0;
  for (size_t i = 0; i < kHeaderSize; ++i) {
    const char c = buffer[i];
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      throw std::runtime_error("Invalid framed message: bad length header");
    }
    message_size = message_size * 16 + static_cast<size_t>(digit);
  }
  if (message_size > kMaxMessageSize) {
    throw std::runtime_error("Invalid framed message: too large");
  }
  return message_size;
}

std::string MessageFramer::unframeMessage(const std::string& framed_message) {
  const size_t message_size = messageSize(framed_message);
  if (framed_message.size() < kHeaderSize + message_size) {
    throw std::runtime_error("Invalid framed message: incomplete");
  }
  return framed_message.substr(kHeaderSize, message_size);
}

bool MessageFramer::isCompleteMessage(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) return false;
  return buffer.size() >= kHeaderSize + messageSize(buffer);
}

}  // namespace protocol
}  // namespace network
}  // namespace remit
