#include "network/tcp_server.hpp"
#include "network/protocol.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace remit {
namespace network {

using observability::LogLevel;

namespace {

// Frames a handler reply. A reply over the frame limit is replaced by an
// ERROR response carrying the same request id; the stream stays in sync.
std::string frameResponse(const std::string& response_json, const std::string& client_addr) {
  if (response_json.size() <= protocol::MessageFramer::kMaxMessageSize) {
    return protocol::MessageFramer::frameMessage(response_json);
  }
  std::string request_id;
  try {
    request_id = protocol::deserializeResponse(response_json).request_id;
  } catch (const std::exception& e) {
    LOG_BUILDER(LogLevel::WARN, "Unreadable oversized response").field("error", e.what());
  }
  LOG_BUILDER(LogLevel::ERROR, "Response too large")
      .field("client", client_addr)
      .field("request_id", request_id)
      .field("bytes", response_json.size());
  return protocol::MessageFramer::frameMessage(protocol::serializeResponse(
      protocol::Response::error(protocol::Status::ERROR, "Response too large", request_id)));
}

}  // namespace

TCPServer::TCPServer(int port, RequestHandler handler)
    : port_(port),
      server_socket_(-1),
      request_handler_(std::move(handler)),
      running_(false),
      next_connection_id_(0) {
}

TCPServer::~TCPServer() {
  stop();
}

bool TCPServer::start() {
  // Create socket
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LOG_BUILDER(LogLevel::ERROR, "Failed to create socket").field("error", std::strerror(errno));
    return false;
  }

  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LOG_BUILDER(LogLevel::ERROR, "Failed to set socket options")
        .field("error", std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  struct sockaddr_in address;
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(static_cast<uint16_t>(port_));

  if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
    LOG_BUILDER(LogLevel::ERROR, "Failed to bind socket")
        .field("port", port_)
        .field("error", std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  socklen_t address_len = sizeof(address);
  if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&address),
                  &address_len) == 0) {
    port_ = ntohs(address.sin_port);
  }

  if (listen(server_socket_, SOMAXCONN) < 0) {
    LOG_BUILDER(LogLevel::ERROR, "Failed to listen on socket")
        .field("error", std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&TCPServer::acceptLoop, this);

  LOG_BUILDER(LogLevel::INFO, "TCP server started").field("port", port_);
  return true;
}

void TCPServer::stop() {
  if (!running_.exchange(false)) return;

  // Close server socket to break accept loop
  if (server_socket_ >= 0) {
    shutdown(server_socket_, SHUT_RDWR);
    close(server_socket_);
    server_socket_ = -1;
  }

  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }

  // Unblock readers, then join outside the lock since clients take it on exit.
  std::unordered_map<uint64_t, ClientConnection> clients;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& pair : clients_) {
      if (std::find(finished_clients_.begin(), finished_clients_.end(), pair.first) ==
          finished_clients_.end()) {
        shutdown(pair.second.socket, SHUT_RDWR);
      }
    }
    clients.swap(clients_);
    finished_clients_.clear();
  }
  for (auto& pair : clients) {
    if (pair.second.thread && pair.second.thread->joinable()) {
      pair.second.thread->join();
    }
  }
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    finished_clients_.clear();
  }

  LOG_INFO("TCP server stopped");
}

void TCPServer::reapFinishedClients() {
  std::vector<std::unique_ptr<std::thread>> done;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (uint64_t connection_id : finished_clients_) {
      auto it = clients_.find(connection_id);
      if (it != clients_.end()) {
        done.push_back(std::move(it->second.thread));
        clients_.erase(it);
      }
    }
    finished_clients_.clear();
  }
  for (auto& thread : done) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
}

void TCPServer::acceptLoop() {
  while (running_) {
    struct sockaddr_in client_address;
    socklen_t client_addr_len = sizeof(client_address);

    int client_socket = accept(server_socket_,
                               reinterpret_cast<struct sockaddr*>(&client_address),
                               &client_addr_len);

    reapFinishedClients();

    if (client_socket < 0) {
      if (running_ && errno != EINTR) {
        LOG_BUILDER(LogLevel::WARN, "Failed to accept connection")
            .field("error", std::strerror(errno));
      }
      continue;
    }

    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);
    std::string client_addr = std::string(client_ip) + ":" +
                              std::to_string(ntohs(client_address.sin_port));

    LOG_BUILDER(LogLevel::INFO, "Accepted connection").field("client", client_addr);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!running_) {
      close(client_socket);
      break;
    }
    observability::getGlobalMetrics().incrementGauge("active_connections");
    const uint64_t connection_id = next_connection_id_++;
    clients_[connection_id] = ClientConnection{
        client_socket,
        std::make_unique<std::thread>(&TCPServer::handleClient, this,
                                      connection_id, client_socket, client_addr)};
  }
}

bool TCPServer::sendAll(int client_socket, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t written = send(client_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(written);
  }
  return true;
}

void TCPServer::handleClient(uint64_t connection_id, int client_socket,
                             std::string client_addr) {
  char buffer[4096];
  std::string message_buffer;
  bool open = true;

  while (running_ && open) {
    ssize_t bytes_read = read(client_socket, buffer, sizeof(buffer));

    if (bytes_read <= 0) {
      if (bytes_read < 0 && errno == EINTR) continue;
      if (bytes_read < 0 && running_) {
        LOG_BUILDER(LogLevel::WARN, "Error reading from client")
            .field("client", client_addr)
            .field("error", std::strerror(errno));
      }
      break;
    }

    message_buffer.append(buffer, static_cast<size_t>(bytes_read));

    while (open) {
      std::string request_json;
      try {
        if (!protocol::MessageFramer::isCompleteMessage(message_buffer)) {
          break;
        }
        const size_t body_size = protocol::MessageFramer::messageSize(message_buffer);
        request_json = message_buffer.substr(protocol::MessageFramer::kHeaderSize, body_size);
        message_buffer.erase(0, protocol::MessageFramer::kHeaderSize + body_size);
      } catch (const std::exception& e) {
        // A bad length header leaves the stream unsynchronized; reply once and drop it.
        LOG_BUILDER(LogLevel::WARN, "Malformed frame from client")
            .field("client", client_addr)
            .field("error", e.what());
        auto error_response = protocol::Response::error(
            protocol::Status::INVALID_REQUEST, "Malformed frame", "");
        if (!sendAll(client_socket, protocol::MessageFramer::frameMessage(
                                        protocol::serializeResponse(error_response)))) {
          LOG_BUILDER(LogLevel::WARN, "Error writing to client").field("client", client_addr);
        }
        open = false;
        break;
      }

      std::string response_json;
      try {
        response_json = request_handler_(request_json);
      } catch (const std::exception& e) {
        LOG_BUILDER(LogLevel::ERROR, "Request handler failed")
            .field("client", client_addr)
            .field("error", e.what());
        response_json = protocol::serializeResponse(protocol::Response::error(
            protocol::Status::ERROR, "Request processing failed", ""));
      }

      if (!sendAll(client_socket, frameResponse(response_json, client_addr))) {
        LOG_BUILDER(LogLevel::WARN, "Error writing to client").field("client", client_addr);
        open = false;
      }
    }
  }

  observability::getGlobalMetrics().decrementGauge("active_connections");
  LOG_BUILDER(LogLevel::INFO, "Closed connection").field("client", client_addr);

  std::lock_guard<std::mutex> lock(connections_mutex_);
  close(client_socket);
  finished_clients_.push_back(connection_id);
}

size_t TCPServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return clients_.size() - finished_clients_.size();
}

}  // namespace network
}  // namespace remit
