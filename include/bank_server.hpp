#ifndef BANK_SERVER_HPP_
#define BANK_SERVER_HPP_

#include "bank_service.hpp"
#include "network/protocol.hpp"
#include "network/tcp_server.hpp"

#include <memory>
#include <string>

namespace remit {

/**
 * Wire front end: decodes protocol requests, dispatches them to the
 * BankService and encodes the reply. Owns the TCP listener.
 */
class BankServer {
 public:
  BankServer(int port, BankService& service);
  ~BankServer();

  // Non-copyable
  BankServer(const BankServer&) = delete;
  BankServer& operator=(const BankServer&) = delete;

  bool start();
  void stop();

  struct Stats {
    bool is_running;
    size_t active_connections;
  };
  Stats getStats() const;

  // Bound port; differs from the configured one when that was 0.
  int getPort() const;

  /**
   * Handles one request body and returns the response body. Never throws:
   * ServiceError codes map to their wire status and any other failure
   * becomes a generic ERROR.
   */
  std::string handleRequest(const std::string& request_json);

 private:
  network::protocol::Response dispatch(const network::protocol::Request& request);

  BankService& service_;
  std::unique_ptr<network::TCPServer> tcp_server_;
};

}  // namespace remit

#endif  // BANK_SERVER_HPP_
