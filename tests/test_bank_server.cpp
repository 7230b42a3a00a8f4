#include "bank_server.hpp"
#include "memory_ledger_store.hpp"
#include "network/tcp_server.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <vector>

using remit::BankServer;
using remit::Money;
using remit::core::TransferEngine;
using namespace remit::network::protocol;

namespace {

int connectLoopback(int port) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<uint16_t>(port));
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (connect(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
    close(fd);
    return -1;
  }
  return fd;
}

bool sendFrame(int fd, const Request& request) {
  const std::string wire = MessageFramer::frameMessage(serializeRequest(request));
  return send(fd, wire.data(), wire.size(), 0) == static_cast<ssize_t>(wire.size());
}

// Reads until `count` framed responses arrived or the peer closed.
std::vector<Response> readResponses(int fd, size_t count) {
  std::string buffer;
  std::vector<Response> responses;
  char chunk[4096];
  while (responses.size() < count) {
    ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) {
      break;
    }
    buffer.append(chunk, static_cast<size_t>(n));
    while (MessageFramer::isCompleteMessage(buffer)) {
      const size_t size = MessageFramer::messageSize(buffer);
      responses.push_back(deserializeResponse(buffer.substr(MessageFramer::kHeaderSize, size)));
      buffer.erase(0, MessageFramer::kHeaderSize + size);
    }
  }
  return responses;
}

class BankServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(store_.createUser("alice", "alice123", "", *Money::parse("50000.00")));
    ASSERT_TRUE(store_.createUser("bob", "bob123", "", *Money::parse("1000.00")));
  }

  Response call(const Request& request) {
    return deserializeResponse(server_.handleRequest(serializeRequest(request)));
  }

  std::string login(const std::string& user, const std::string& password) {
    auto response = call(Request::login("login", user, password));
    EXPECT_EQ(response.status, Status::SUCCESS) << response.message;
    return response.payload.value("session_token", std::string());
  }

  remit::MemoryLedgerStore store_;
  remit::core::SessionManager sessions_{remit::core::SessionManager::Config{}};
  remit::core::TransferEngine engine_{store_};
  remit::BankService service_{store_, sessions_, engine_};
  BankServer server_{0, service_};
};

}  // namespace

TEST_F(BankServerTest, LoginAndBalance) {
  const std::string token = login("alice", "alice123");
  ASSERT_EQ(token.size(), 64u);

  auto response = call(Request::getBalance("r2", token));
  EXPECT_EQ(response.status, Status::SUCCESS);
  EXPECT_EQ(response.request_id, "r2");
  EXPECT_EQ(response.payload["balance"], "50000.00");
}

TEST_F(BankServerTest, WrongPasswordMapsToInvalidCredentials) {
  auto response = call(Request::login("r1", "alice", "wrong"));
  EXPECT_EQ(response.status, Status::INVALID_CREDENTIALS);
  EXPECT_FALSE(response.payload.contains("session_token"));
}

TEST_F(BankServerTest, MissingTokenIsUnauthorized) {
  EXPECT_EQ(call(Request::getBalance("r1", "")).status, Status::UNAUTHORIZED);
  EXPECT_EQ(call(Request::listTransfers("r2", "nope")).status, Status::UNAUTHORIZED);
  EXPECT_EQ(call(Request::logout("r3", "nope")).status, Status::UNAUTHORIZED);
}

TEST_F(BankServerTest, SubmitAndQueryTransfer) {
  const std::string token = login("alice", "alice123");
  auto submitted = call(Request::submitTransfer("r1", token, "bob", "5000.00", "invoice 7"));
  ASSERT_EQ(submitted.status, Status::SUCCESS) << submitted.message;
  EXPECT_EQ(submitted.payload["fee"], "12.50");
  EXPECT_EQ(submitted.payload["new_balance"], "44987.50");
  EXPECT_EQ(submitted.payload["status"], "COMPLETED");

  const std::string id = submitted.payload["transfer_id"].get<std::string>();
  auto status = call(Request::getTransferStatus("r2", token, id));
  ASSERT_EQ(status.status, Status::SUCCESS);
  EXPECT_EQ(status.payload["amount"], "5000.00");
  EXPECT_EQ(status.payload["reference"], "invoice 7");

  auto list = call(Request::listTransfers("r3", login("bob", "bob123")));
  ASSERT_EQ(list.status, Status::SUCCESS);
  EXPECT_EQ(list.payload["transfers"].size(), 1u);
}

TEST_F(BankServerTest, InsufficientFundsIsSuccessfulResponseWithFailedTransfer) {
  const std::string token = login("bob", "bob123");
  auto response = call(Request::submitTransfer("r1", token, "alice", "2000.00"));
  EXPECT_EQ(response.status, Status::SUCCESS);
  EXPECT_EQ(response.payload["status"], "FAILED");
  EXPECT_EQ(response.payload["reason"], "InsufficientFunds");
}

TEST_F(BankServerTest, BusinessErrorsMapToStatuses) {
  const std::string token = login("alice", "alice123");
  EXPECT_EQ(call(Request::submitTransfer("r1", token, "ghost", "1.00")).status,
            Status::UNKNOWN_RECIPIENT);
  EXPECT_EQ(call(Request::submitTransfer("r2", token, "alice", "1.00")).status,
            Status::SELF_TRANSFER_NOT_ALLOWED);
  EXPECT_EQ(call(Request::submitTransfer("r3", token, "bob", "1.234")).status,
            Status::INVALID_AMOUNT);
  EXPECT_EQ(call(Request::getTransferStatus("r4", token, "tr_missing")).status,
            Status::NOT_FOUND);
}

TEST_F(BankServerTest, MalformedRequestsAreRejected) {
  auto garbage = deserializeResponse(server_.handleRequest("{oops"));
  EXPECT_EQ(garbage.status, Status::INVALID_REQUEST);

  auto unknown = deserializeResponse(server_.handleRequest(R"({"type":"DEPOSIT"})"));
  EXPECT_EQ(unknown.status, Status::INVALID_REQUEST);

  const std::string token = login("alice", "alice123");
  Request numeric_amount = Request::submitTransfer("r1", token, "bob", "1.00");
  numeric_amount.payload["amount"] = 1.0;
  EXPECT_EQ(call(numeric_amount).status, Status::INVALID_REQUEST);

  Request no_fields = Request::login("r2", "", "");
  no_fields.payload = nlohmann::json::object();
  EXPECT_EQ(call(no_fields).status, Status::INVALID_REQUEST);
}

TEST_F(BankServerTest, HealthMetricsAndHeartbeat) {
  auto health = call(Request::healthCheck("h"));
  EXPECT_EQ(health.status, Status::SUCCESS);
  EXPECT_EQ(health.payload["store_ok"], true);

  auto metrics = call(Request::metrics("m"));
  EXPECT_EQ(metrics.status, Status::SUCCESS);
  EXPECT_TRUE(metrics.payload["text"].is_string());

  EXPECT_EQ(call(Request::heartbeat("b")).status, Status::SUCCESS);
}

TEST_F(BankServerTest, ServesFramedRequestsOverTcp) {
  ASSERT_TRUE(server_.start());
  ASSERT_GT(server_.getPort(), 0);

  int fd = connectLoopback(server_.getPort());
  ASSERT_GE(fd, 0);

  // Two requests in one write; the server must split them by their headers.
  const std::string wire = MessageFramer::frameMessage(serializeRequest(Request::heartbeat("one"))) +
                           MessageFramer::frameMessage(serializeRequest(Request::heartbeat("two")));
  ASSERT_EQ(send(fd, wire.data(), wire.size(), 0), static_cast<ssize_t>(wire.size()));

  auto responses = readResponses(fd, 2);
  close(fd);

  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0].request_id, "one");
  EXPECT_EQ(responses[1].request_id, "two");
  EXPECT_EQ(responses[1].status, Status::SUCCESS);

  server_.stop();
  EXPECT_FALSE(server_.getStats().is_running);
}

TEST_F(BankServerTest, PayloadIsNotReadBeforeTheTokenIsChecked) {
  Request submit = Request::submitTransfer("r1", "nope", "bob", "1.00");
  submit.payload = nlohmann::json::object();
  EXPECT_EQ(call(submit).status, Status::UNAUTHORIZED);

  Request status = Request::getTransferStatus("r2", "nope", "tr_1");
  status.payload = nlohmann::json::object();
  EXPECT_EQ(call(status).status, Status::UNAUTHORIZED);

  Request list = Request::listTransfers("r3", "nope");
  list.payload["limit"] = "all";
  EXPECT_EQ(call(list).status, Status::UNAUTHORIZED);
}

TEST_F(BankServerTest, ListingIsCappedAndFitsInOneFrame) {
  const size_t total = TransferEngine::kMaxListLimit + 50;
  for (size_t i = 0; i < total; ++i) {
    remit::Transfer transfer;
    transfer.transfer_id = "tr_" + std::to_string(i);
    transfer.from_user = "alice";
    transfer.to_user = "bob";
    transfer.amount = *Money::parse("1.00");
    transfer.reference = std::string(300, 'r');
    transfer.status = remit::TransferStatus::COMPLETED;
    transfer.created_at = static_cast<remit::Timestamp>(i);
    transfer.updated_at = transfer.created_at;
    store_.createTransfer(transfer);
  }
  const std::string token = login("alice", "alice123");

  auto by_default = call(Request::listTransfers("r1", token));
  ASSERT_EQ(by_default.status, Status::SUCCESS) << by_default.message;
  ASSERT_EQ(by_default.payload["transfers"].size(), TransferEngine::kDefaultListLimit);
  EXPECT_EQ(by_default.payload["transfers"][0]["transfer_id"],
            "tr_" + std::to_string(total - 1));

  auto small = call(Request::listTransfers("r2", token, 3));
  ASSERT_EQ(small.status, Status::SUCCESS);
  EXPECT_EQ(small.payload["transfers"].size(), 3u);

  const std::string raw =
      server_.handleRequest(serializeRequest(Request::listTransfers("r3", token, total)));
  EXPECT_LE(raw.size(), MessageFramer::kMaxMessageSize);
  auto capped = deserializeResponse(raw);
  ASSERT_EQ(capped.status, Status::SUCCESS);
  EXPECT_EQ(capped.payload["transfers"].size(), TransferEngine::kMaxListLimit);
}

TEST_F(BankServerTest, RejectsInvalidListLimits) {
  const std::string token = login("alice", "alice123");
  for (const nlohmann::json& limit : {nlohmann::json(0), nlohmann::json(-5),
                                      nlohmann::json("ten"), nlohmann::json(2.5)}) {
    Request request = Request::listTransfers("r1", token);
    request.payload["limit"] = limit;
    EXPECT_EQ(call(request).status, Status::INVALID_REQUEST) << limit.dump();
  }
}

TEST(TcpServerTest, OversizedReplyBecomesErrorAndConnectionStaysOpen) {
  remit::network::TCPServer server(0, [](const std::string& body) {
    Request request = deserializeRequest(body);
    if (request.request_id == "big") {
      return serializeResponse(
          Response::success(std::string(MessageFramer::kMaxMessageSize, 'x'), request.request_id));
    }
    return serializeResponse(Response::success("ok", request.request_id));
  });
  ASSERT_TRUE(server.start());

  int fd = connectLoopback(server.getPort());
  ASSERT_GE(fd, 0);

  ASSERT_TRUE(sendFrame(fd, Request::heartbeat("big")));
  auto first = readResponses(fd, 1);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].status, Status::ERROR);
  EXPECT_EQ(first[0].message, "Response too large");
  EXPECT_EQ(first[0].request_id, "big");

  ASSERT_TRUE(sendFrame(fd, Request::heartbeat("after")));
  auto second = readResponses(fd, 1);
  close(fd);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].status, Status::SUCCESS);
  EXPECT_EQ(second[0].request_id, "after");

  server.stop();
}
