#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using remit::observability::Logger;
using remit::observability::LogLevel;
using remit::observability::MetricsCollector;

namespace {

// Routes the process logger into a buffer for one test.
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
    Logger::getInstance().setLogLevel(LogLevel::ERROR);
  }

  std::vector<nlohmann::json> lines() {
    std::vector<nlohmann::json> parsed;
    std::istringstream in(output_.str());
    std::string line;
    while (std::getline(in, line)) {
      parsed.push_back(nlohmann::json::parse(line));
    }
    return parsed;
  }

  std::stringstream output_;
};

}  // namespace

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  LOG_INFO("first");
  LOG_WARN("second \"quoted\"\nline");

  auto entries = lines();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["level"], "INFO");
  EXPECT_EQ(entries[0]["message"], "first");
  EXPECT_TRUE(entries[0].contains("timestamp"));
  EXPECT_TRUE(entries[0].contains("thread"));
  EXPECT_EQ(entries[1]["message"], "second \"quoted\"\nline");
}

TEST_F(LoggerTest, BuilderAddsTypedFields) {
  LOG_BUILDER(LogLevel::INFO, "transfer").field("id", "tr_1").field("count", 3).field("ok", true);

  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["id"], "tr_1");
  EXPECT_EQ(entries[0]["count"], 3);
  EXPECT_EQ(entries[0]["ok"], true);
  EXPECT_FALSE(entries[0]["component"].get<std::string>().empty());
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  LOG_DEBUG("hidden");
  LOG_INFO("hidden");
  LOG_ERROR("shown");

  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["level"], "ERROR");
}

TEST_F(LoggerTest, CorrelationIdIsRecorded) {
  Logger::getInstance().info("handled", "BankServer", "req-42");
  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["component"], "BankServer");
  EXPECT_EQ(entries[0]["correlation_id"], "req-42");
}

TEST_F(LoggerTest, InvalidUtf8DoesNotThrow) {
  EXPECT_NO_THROW(LOG_INFO(std::string("bad \xff byte")));
  EXPECT_EQ(lines().size(), 1u);
}

TEST(LogLevelTest, ParsesBothCases) {
  EXPECT_EQ(remit::observability::logLevelFromString("warn"), LogLevel::WARN);
  EXPECT_EQ(remit::observability::logLevelFromString("DEBUG"), LogLevel::DEBUG);
  EXPECT_FALSE(remit::observability::logLevelFromString("verbose").has_value());
  EXPECT_EQ(remit::observability::logLevelToString(LogLevel::FATAL), "FATAL");
}

TEST(MetricsCollectorTest, CountersAndGauges) {
  MetricsCollector metrics;
  metrics.incrementCounter("transfers_completed_total");
  metrics.incrementCounter("transfers_completed_total", 2);
  metrics.incrementGauge("active_connections");
  metrics.incrementGauge("active_connections");
  metrics.decrementGauge("active_connections");

  EXPECT_DOUBLE_EQ(metrics.counterValue("transfers_completed_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("active_connections"), 1.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("missing"), 0.0);
}

TEST(MetricsCollectorTest, ExportsPrometheusText) {
  MetricsCollector metrics;
  metrics.describe("logins_failed_total", "Rejected logins");
  metrics.incrementCounter("logins_failed_total");
  metrics.observeHistogram("transfer_apply_seconds", 0.002);
  metrics.observeHistogram("transfer_apply_seconds", 0.3);

  const std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP logins_failed_total Rejected logins"), std::string::npos);
  EXPECT_NE(text.find("# TYPE logins_failed_total counter"), std::string::npos);
  EXPECT_NE(text.find("logins_failed_total 1"), std::string::npos);
  EXPECT_NE(text.find("# TYPE transfer_apply_seconds histogram"), std::string::npos);
  EXPECT_NE(text.find("transfer_apply_seconds_bucket{le=\"0.0025\"} 1"), std::string::npos);
  EXPECT_NE(text.find("transfer_apply_seconds_bucket{le=\"0.5\"} 2"), std::string::npos);
  EXPECT_NE(text.find("transfer_apply_seconds_bucket{le=\"+Inf\"} 2"), std::string::npos);
  EXPECT_NE(text.find("transfer_apply_seconds_count 2"), std::string::npos);
}

TEST(MetricsCollectorTest, TimerObservesOnce) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "transfer_apply_seconds");
  }
  EXPECT_EQ(metrics.histogramCount("transfer_apply_seconds"), 1u);

  metrics.reset();
  EXPECT_EQ(metrics.histogramCount("transfer_apply_seconds"), 0u);
}
