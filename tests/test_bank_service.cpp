#include "bank_service.hpp"
#include "errors.hpp"
#include "memory_ledger_store.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

using remit::BankService;
using remit::ErrorCode;
using remit::MemoryLedgerStore;
using remit::Money;

namespace {

class BankServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(store_.createUser("alice", "alice123", "", *Money::parse("50000.00")));
    ASSERT_TRUE(store_.createUser("bob", "bob123", "", *Money::parse("1000.00")));
  }

  template <typename Fn>
  void expectError(ErrorCode code, Fn&& fn) {
    try {
      fn();
      FAIL() << "expected " << remit::errorCodeToString(code);
    } catch (const remit::ServiceError& e) {
      EXPECT_EQ(e.code(), code) << e.what();
    }
  }

  MemoryLedgerStore store_;
  remit::core::SessionManager sessions_{remit::core::SessionManager::Config{}};
  remit::core::TransferEngine engine_{store_};
  BankService service_{store_, sessions_, engine_};
};

}  // namespace

TEST_F(BankServiceTest, LoginReturnsUsableToken) {
  const std::string token = service_.login("alice", "alice123");
  EXPECT_EQ(service_.getBalance(token), *Money::parse("50000.00"));
  EXPECT_EQ(store_.getAuditLogs(1).front().operation, "LOGIN_SUCCESS");
}

TEST_F(BankServiceTest, BadCredentialsAreIndistinguishable) {
  std::string wrong_password;
  std::string unknown_user;
  try {
    service_.login("alice", "nope");
  } catch (const remit::ServiceError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidCredentials);
    wrong_password = e.what();
  }
  try {
    service_.login("mallory", "alice123");
  } catch (const remit::ServiceError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidCredentials);
    unknown_user = e.what();
  }
  EXPECT_FALSE(wrong_password.empty());
  EXPECT_EQ(wrong_password, unknown_user);
  EXPECT_EQ(sessions_.activeCount(), 0u);
  EXPECT_EQ(store_.getAuditLogs(1).front().operation, "LOGIN_FAILED");
}

TEST_F(BankServiceTest, EmptyUsernameIsRejected) {
  expectError(ErrorCode::InvalidCredentials, [&] { service_.login("", ""); });
}

TEST_F(BankServiceTest, EveryTokenOperationRequiresSession) {
  auto& metrics = remit::observability::getGlobalMetrics();
  const double before = metrics.counterValue("unauthorized_requests_total");

  expectError(ErrorCode::Unauthorized, [&] { service_.getBalance("bogus"); });
  expectError(ErrorCode::Unauthorized, [&] { service_.logout("bogus"); });
  expectError(ErrorCode::Unauthorized, [&] { service_.listTransfers("bogus"); });
  expectError(ErrorCode::Unauthorized, [&] { service_.getTransferStatus("bogus", "tr_x"); });
  // Authentication precedes validation of the other arguments.
  expectError(ErrorCode::Unauthorized,
              [&] { service_.submitTransfer("bogus", "ghost", "not-a-number", ""); });

  EXPECT_EQ(metrics.counterValue("unauthorized_requests_total"), before + 5);
  EXPECT_TRUE(store_.getTransfersByUser("alice").empty());
}

TEST_F(BankServiceTest, LogoutEndsSession) {
  const std::string token = service_.login("bob", "bob123");
  service_.logout(token);
  expectError(ErrorCode::Unauthorized, [&] { service_.getBalance(token); });
  EXPECT_EQ(store_.getAuditLogs(1).front().operation, "LOGOUT");
}

TEST_F(BankServiceTest, TransferFlowThroughFacade) {
  const std::string alice = service_.login("alice", "alice123");
  const std::string bob = service_.login("bob", "bob123");

  auto result = service_.submitTransfer(alice, "bob", "100.00", "dinner");
  EXPECT_EQ(result.status, remit::TransferStatus::COMPLETED);
  EXPECT_EQ(service_.getBalance(alice), *Money::parse("49900.00"));
  EXPECT_EQ(service_.getBalance(bob), *Money::parse("1100.00"));

  auto seen_by_bob = service_.getTransferStatus(bob, result.transfer_id);
  EXPECT_EQ(seen_by_bob.reference, "dinner");
  EXPECT_EQ(service_.listTransfers(bob).size(), 1u);

  expectError(ErrorCode::SelfTransferNotAllowed,
              [&] { service_.submitTransfer(alice, "alice", "1.00", ""); });
}

TEST_F(BankServiceTest, HealthReportsStoreAndSessions) {
  service_.login("alice", "alice123");
  auto health = service_.health();
  EXPECT_TRUE(health.store.ok);
  EXPECT_EQ(health.active_sessions, 1u);
}
