#include "core/fee_calculator.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

using remit::Money;
using remit::core::FeeCalculator;

namespace {

std::string feeFor(const std::string& amount) {
  return FeeCalculator::fee(*Money::parse(amount)).toString();
}

}  // namespace

TEST(FeeCalculatorTest, TierBoundaries) {
  EXPECT_EQ(feeFor("0.01"), "0.00");
  EXPECT_EQ(feeFor("2000.00"), "0.00");
  EXPECT_EQ(feeFor("2000.01"), "5.00");
  EXPECT_EQ(feeFor("5000.00"), "12.50");
  EXPECT_EQ(feeFor("10000.00"), "20.00");
  EXPECT_EQ(feeFor("10000.01"), "20.00");
  EXPECT_EQ(feeFor("20000.00"), "25.00");
  EXPECT_EQ(feeFor("50000.00"), "40.00");
  EXPECT_EQ(feeFor("100000.00"), "50.00");
  EXPECT_EQ(feeFor("100000.01"), "50.00");
  EXPECT_EQ(feeFor("1000000.00"), "100.00");
}

TEST(FeeCalculatorTest, RoundsHalfUpOnce) {
  // 2000.02 * 0.25% = 5.00005
  EXPECT_EQ(feeFor("2000.02"), "5.00");
  // 2002.00 * 0.25% = 5.005
  EXPECT_EQ(feeFor("2002.00"), "5.01");
  // 2001.99 * 0.25% = 5.004975
  EXPECT_EQ(feeFor("2001.99"), "5.00");
  // 30000.04 * 0.125% = 37.50005
  EXPECT_EQ(feeFor("30000.04"), "37.50");
}

TEST(FeeCalculatorTest, RejectsNonPositiveAmounts) {
  try {
    FeeCalculator::fee(Money());
    FAIL() << "expected InvalidAmount";
  } catch (const remit::ServiceError& e) {
    EXPECT_EQ(e.code(), remit::ErrorCode::InvalidAmount);
  }
  EXPECT_THROW(FeeCalculator::fee(Money::fromCents(-100)), remit::ServiceError);
}

TEST(FeeCalculatorTest, FeeNeverExceedsAmount) {
  for (int64_t cents = 1; cents < 400000; cents += 997) {
    Money amount = Money::fromCents(cents);
    Money fee = FeeCalculator::fee(amount);
    EXPECT_GE(fee.cents(), 0) << amount.toString();
    EXPECT_LE(fee, amount) << amount.toString();
  }
  for (int64_t cents = 400000; cents < 50000000; cents += 123457) {
    Money fee = FeeCalculator::fee(Money::fromCents(cents));
    EXPECT_LE(fee.cents(), 10000);
  }
}

TEST(FeeCalculatorTest, ScheduleIsContiguous) {
  const auto& tiers = FeeCalculator::schedule();
  ASSERT_FALSE(tiers.empty());
  EXPECT_EQ(tiers.front().lower_exclusive, Money());
  for (size_t i = 1; i < tiers.size(); ++i) {
    ASSERT_TRUE(tiers[i - 1].upper_inclusive.has_value());
    EXPECT_EQ(*tiers[i - 1].upper_inclusive, tiers[i].lower_exclusive);
  }
  EXPECT_FALSE(tiers.back().upper_inclusive.has_value());
}
