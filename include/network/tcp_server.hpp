#ifndef TCP_SERVER_HPP_
#define TCP_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace remit {
namespace network {

/**
 * TCP Server for the remittance service.
 * Reads length-prefixed frames, hands each body to the request handler and
 * writes back the framed reply. One thread per client connection.
 */
class TCPServer {
 public:
  using RequestHandler = std::function<std::string(const std::string&)>;

  // Port 0 binds an ephemeral port; getPort() reports it after start().
  TCPServer(int port, RequestHandler handler);
  ~TCPServer();

  // Non-copyable
  TCPServer(const TCPServer&) = delete;
  TCPServer& operator=(const TCPServer&) = delete;

  /**
   * Start the server and begin accepting connections.
   */
  bool start();

  /**
   * Stop the server, shut down client sockets and join every thread.
   */
  void stop();

  bool isRunning() const { return running_.load(); }

  int getPort() const { return port_; }

  /**
   * Get number of active connections.
   */
  size_t getConnectionCount() const;

 private:
  void acceptLoop();
  void handleClient(uint64_t connection_id, int client_socket, std::string client_addr);
  bool sendAll(int client_socket, const std::string& data);
  void reapFinishedClients();

  int port_;
  int server_socket_;
  RequestHandler request_handler_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> accept_thread_;
  struct ClientConnection {
    int socket;
    std::unique_ptr<std::thread> thread;
  };

  // Keyed by connection id rather than fd, since a closed fd may be reused.
  std::unordered_map<uint64_t, ClientConnection> clients_;
  std::vector<uint64_t> finished_clients_;
  uint64_t next_connection_id_;
  mutable std::mutex connections_mutex_;
};

}  // namespace network
}  // namespace remit

#endif  // TCP_SERVER_HPP_
