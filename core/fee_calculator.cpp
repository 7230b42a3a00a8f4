#include "core/fee_calculator.hpp"
#include "errors.hpp"

namespace remit {
namespace core {

const std::vector<FeeTier>& FeeCalculator::schedule() {
  static const std::vector<FeeTier> tiers = {
      {Money::fromCents(0), Money::fromCents(200000), 0, std::nullopt},
      {Money::fromCents(200000), Money::fromCents(1000000), 250, Money::fromCents(2000)},
      {Money::fromCents(1000000), Money::fromCents(2000000), 200, Money::fromCents(2500)},
      {Money::fromCents(2000000), Money::fromCents(5000000), 125, Money::fromCents(4000)},
      {Money::fromCents(5000000), Money::fromCents(10000000), 80, Money::fromCents(5000)},
      {Money::fromCents(10000000), std::nullopt, 50, Money::fromCents(10000)},
  };
  return tiers;
}

Money FeeCalculator::fee(Money amount) {
  if (!amount.isPositive()) {
    throw ServiceError(ErrorCode::InvalidAmount, "Amount must be greater than zero");
  }

  for (const auto& tier : schedule()) {
    if (amount <= tier.lower_exclusive) continue;
    if (tier.upper_inclusive && amount > *tier.upper_inclusive) continue;

    // cents * rate / scale, rounded half-up once at the end.
    const int64_t scaled = amount.cents() * tier.rate_per_100k;
    int64_t fee_cents = scaled / kRateScale;
    if ((scaled % kRateScale) * 2 >= kRateScale) {
      ++fee_cents;
    }

    Money result = Money::fromCents(fee_cents);
    if (tier.cap && result > *tier.cap) {
      result = *tier.cap;
    }
    return result;
  }

  // The last tier is unbounded, so every positive amount matched above.
  return Money();
}

}  // namespace core
}  // namespace remit
