#include "money.hpp"

#include <cctype>

namespace remit {

std::optional<Money> Money::parse(const std::string& text) {
  if (text.empty()) return std::nullopt;

  size_t pos = 0;
  bool negative = false;
  if (text[pos] == '+' || text[pos] == '-') {
    negative = text[pos] == '-';
    ++pos;
  }

  int64_t whole = 0;
  size_t whole_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    whole = whole * 10 + (text[pos] - '0');
    ++pos;
    ++whole_digits;
    if (whole_digits > 15) return std::nullopt;
  }

  int64_t fraction = 0;
  size_t fraction_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (fraction_digits == 2) return std::nullopt;
      fraction = fraction * 10 + (text[pos] - '0');
      ++pos;
      ++fraction_digits;
    }
    if (fraction_digits == 0) return std::nullopt;
  }

  if (pos != text.size() || whole_digits == 0) return std::nullopt;

  if (fraction_digits == 1) fraction *= 10;
  int64_t cents = whole * 100 + fraction;
  if (cents > kMaxCents) return std::nullopt;
  return Money(negative ? -cents : cents);
}

std::string Money::toString() const {
  int64_t magnitude = cents_ < 0 ? -cents_ : cents_;
  std::string fraction = std::to_string(magnitude % 100);
  if (fraction.size() < 2) fraction.insert(0, "0");

  std::string out = cents_ < 0 ? "-" : "";
  out += std::to_string(magnitude / 100);
  out += ".";
  out += fraction;
  return out;
}

}  // namespace remit
