#ifndef MONEY_HPP_
#define MONEY_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace remit {

/**
 * Exact monetary amount with two fraction digits, stored as integer cents.
 * Crosses every external boundary as decimal text ("1234.50").
 */
class Money {
 public:
  Money() = default;

  static Money fromCents(int64_t cents) { return Money(cents); }

  /**
   * Parses plain decimal text: optional sign, digits, optional '.' followed by
   * one or two digits. Rejects exponents, "nan", "inf", whitespace and more
   * than two fraction digits. Returns nullopt on any rejection.
   */
  static std::optional<Money> parse(const std::string& text);

  int64_t cents() const { return cents_; }

  bool isPositive() const { return cents_ > 0; }
  bool isNegative() const { return cents_ < 0; }

  // Always renders two fraction digits, e.g. "0.00", "-12.50".
  std::string toString() const;

  Money operator+(Money other) const { return Money(cents_ + other.cents_); }
  Money operator-(Money other) const { return Money(cents_ - other.cents_); }
  Money& operator+=(Money other) {
    cents_ += other.cents_;
    return *this;
  }
  Money& operator-=(Money other) {
    cents_ -= other.cents_;
    return *this;
  }

  bool operator==(Money other) const { return cents_ == other.cents_; }
  bool operator!=(Money other) const { return cents_ != other.cents_; }
  bool operator<(Money other) const { return cents_ < other.cents_; }
  bool operator<=(Money other) const { return cents_ <= other.cents_; }
  bool operator>(Money other) const { return cents_ > other.cents_; }
  bool operator>=(Money other) const { return cents_ >= other.cents_; }

  // Largest magnitude accepted by parse(): 999,999,999,999,999.99
  static constexpr int64_t kMaxCents = 99999999999999999LL;

 private:
  explicit Money(int64_t cents) : cents_(cents) {}

  int64_t cents_ = 0;
};

}  // namespace remit

#endif  // MONEY_HPP_
