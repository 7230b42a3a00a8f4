#include "bank_server.hpp"

#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <cstdint>

namespace remit {

namespace protocol = network::protocol;
using observability::LogLevel;
using observability::Logger;

namespace {

std::string requireString(const nlohmann::json& payload, const std::string& key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    throw ServiceError(ErrorCode::InvalidRequest, "Missing or non-string field: " + key);
  }
  return it->get<std::string>();
}

std::string optionalString(const nlohmann::json& payload, const std::string& key) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw ServiceError(ErrorCode::InvalidRequest, "Non-string field: " + key);
  }
  return it->get<std::string>();
}

size_t optionalLimit(const nlohmann::json& payload, const std::string& key, size_t fallback) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_unsigned() || it->get<uint64_t>() == 0) {
    throw ServiceError(ErrorCode::InvalidRequest, "Field must be a positive integer: " + key);
  }
  return static_cast<size_t>(it->get<uint64_t>());
}

}  // namespace

BankServer::BankServer(int port, BankService& service) : service_(service) {
  tcp_server_ = std::make_unique<network::TCPServer>(
      port, [this](const std::string& request) {
        return handleRequest(request);
      });
}

BankServer::~BankServer() {
  stop();
}

bool BankServer::start() {
  if (!tcp_server_->start()) {
    LOG_ERROR("Failed to start TCP server");
    return false;
  }
  LOG_BUILDER(LogLevel::INFO, "Remittance server listening").field("port", tcp_server_->getPort());
  return true;
}

void BankServer::stop() {
  if (tcp_server_ && tcp_server_->isRunning()) {
    tcp_server_->stop();
    LOG_INFO("Remittance server stopped");
  }
}

BankServer::Stats BankServer::getStats() const {
  Stats stats;
  stats.is_running = tcp_server_->isRunning();
  stats.active_connections = tcp_server_->getConnectionCount();
  return stats;
}

int BankServer::getPort() const {
  return tcp_server_->getPort();
}

std::string BankServer::handleRequest(const std::string& request_json) {
  protocol::Request request;
  try {
    request = protocol::deserializeRequest(request_json);
  } catch (const std::exception& e) {
    LOG_BUILDER(LogLevel::WARN, "Malformed request").field("error", e.what());
    return protocol::serializeResponse(
        protocol::Response::error(protocol::Status::INVALID_REQUEST, "Malformed request", ""));
  }

  try {
    return protocol::serializeResponse(dispatch(request));
  } catch (const ServiceError& e) {
    Logger::LogBuilder(e.code() == ErrorCode::StoreUnavailable ? LogLevel::ERROR : LogLevel::INFO,
                       "Request rejected", "BankServer", request.request_id)
        .field("code", errorCodeToString(e.code()))
        .field("error", e.what());
    // Store failures may carry driver text; clients get a fixed message.
    const std::string message =
        e.code() == ErrorCode::StoreUnavailable ? "Store unavailable" : e.what();
    return protocol::serializeResponse(protocol::Response::error(
        protocol::statusForError(e.code()), message, request.request_id));
  } catch (const std::exception& e) {
    Logger::LogBuilder(LogLevel::ERROR, "Request processing failed", "BankServer",
                       request.request_id)
        .field("error", e.what());
    return protocol::serializeResponse(protocol::Response::error(
        protocol::Status::ERROR, "Request processing failed", request.request_id));
  }
}

protocol::Response BankServer::dispatch(const protocol::Request& request) {
  const std::string& id = request.request_id;
  const nlohmann::json& payload = request.payload;

  switch (request.type) {
    case protocol::MessageType::LOGIN: {
      const std::string token = service_.login(requireString(payload, "username"),
                                               requireString(payload, "password"));
      return protocol::Response::loggedIn(token, id);
    }

    case protocol::MessageType::LOGOUT:
      service_.logout(request.session_token);
      return protocol::Response::success("Logged out", id);

    case protocol::MessageType::GET_BALANCE:
      return protocol::Response::balanceResult(service_.getBalance(request.session_token), id);

    // Token-taking calls authenticate before any payload field is read.
    case protocol::MessageType::SUBMIT_TRANSFER: {
      service_.authenticate(request.session_token);
      auto result = service_.submitTransfer(request.session_token,
                                            requireString(payload, "recipient"),
                                            requireString(payload, "amount"),
                                            optionalString(payload, "reference"));
      return protocol::Response::transferResult(result, id);
    }

    case protocol::MessageType::GET_TRANSFER_STATUS:
      service_.authenticate(request.session_token);
      return protocol::Response::transferRecord(
          service_.getTransferStatus(request.session_token, requireString(payload, "transfer_id")),
          id);

    case protocol::MessageType::LIST_TRANSFERS: {
      service_.authenticate(request.session_token);
      const size_t limit =
          optionalLimit(payload, "limit", core::TransferEngine::kDefaultListLimit);
      return protocol::Response::transferList(service_.listTransfers(request.session_token, limit),
                                              id);
    }

    case protocol::MessageType::HEALTH_CHECK: {
      auto health = service_.health();
      nlohmann::json body;
      body["store_ok"] = health.store.ok;
      body["detail"] = health.store.detail;
      body["active_sessions"] = health.active_sessions;
      if (!health.store.ok) {
        auto response = protocol::Response::error(protocol::Status::STORE_UNAVAILABLE,
                                                  "Store degraded", id);
        response.payload = body;
        return response;
      }
      return protocol::Response::success("Healthy", id, body);
    }

    case protocol::MessageType::METRICS: {
      nlohmann::json body;
      body["text"] = observability::getGlobalMetrics().exportMetrics();
      return protocol::Response::success("Metrics exported", id, body);
    }

    case protocol::MessageType::HEARTBEAT:
      return protocol::Response::success("Heartbeat acknowledged", id);

    case protocol::MessageType::UNKNOWN:
      break;
  }
  throw ServiceError(ErrorCode::InvalidRequest, "Unknown message type");
}

}  // namespace remit
