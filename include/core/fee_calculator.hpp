#ifndef FEE_CALCULATOR_HPP_
#define FEE_CALCULATOR_HPP_

#include "money.hpp"

#include <optional>
#include <vector>

namespace remit {
namespace core {

/**
 * One bracket of the fee schedule. An amount belongs to the bracket when
 * lower_exclusive < amount <= upper_inclusive (no upper bound on the last one).
 * Rates are expressed in parts per 100,000 so 0.125% is exactly 125.
 */
struct FeeTier {
  Money lower_exclusive;
  std::optional<Money> upper_inclusive;
  int64_t rate_per_100k;
  std::optional<Money> cap;
};

/**
 * Tiered, capped transfer fee. Stateless.
 */
class FeeCalculator {
 public:
  static constexpr int64_t kRateScale = 100000;

  /**
   * Returns the fee for a strictly positive amount. Throws
   * ServiceError(InvalidAmount) otherwise.
   */
  static Money fee(Money amount);

  static const std::vector<FeeTier>& schedule();
};

}  // namespace core
}  // namespace remit

#endif  // FEE_CALCULATOR_HPP_
