#include "paystream/common/amount.hpp"

namespace paystream {
namespace common {

namespace {
// A single parsed value stays far below the int64 limit; balances built from
// many of them are summed with checked_add/checked_sub.
constexpr std::int64_t kMaxWholePart = 100'000'000'000'000;  // 1e14

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}
}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  std::size_t pos = 0;
  if (text[pos] == '+' || text[pos] == '-') {
    negative = text[pos] == '-';
    ++pos;
  }

  std::int64_t whole = 0;
  std::size_t whole_digits = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    whole = whole * 10 + (text[pos] - '0');
    if (whole > kMaxWholePart) {
      return std::nullopt;
    }
    ++whole_digits;
    ++pos;
  }

  std::int64_t fraction = 0;
  std::size_t fraction_digits = 0;
  bool round_up = false;
  bool any_nonzero = whole != 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && is_digit(text[pos])) {
      any_nonzero = any_nonzero || text[pos] != '0';
      if (fraction_digits < static_cast<std::size_t>(kScale)) {
        fraction = fraction * 10 + (text[pos] - '0');
      } else if (fraction_digits == static_cast<std::size_t>(kScale)) {
        round_up = text[pos] >= '5';
      }
      ++fraction_digits;
      ++pos;
    }
  }

  if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
    return std::nullopt;
  }

  for (std::size_t i = fraction_digits; i < static_cast<std::size_t>(kScale); ++i) {
    fraction *= 10;
  }

  std::int64_t units = whole * kUnitsPerWhole + fraction + (round_up ? 1 : 0);
  if (units == 0 && any_nonzero) {
    units = 1;  // smallest representable magnitude
  }
  return Amount{negative ? -units : units};
}

std::string Amount::to_string() const {
  const bool negative = units_ < 0;
  // Magnitude as unsigned so that the most negative value does not overflow.
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(units_)
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t whole = magnitude / kUnitsPerWhole;
  std::uint64_t fraction = magnitude % kUnitsPerWhole;

  std::string digits = std::to_string(fraction);
  digits.insert(0, static_cast<std::size_t>(kScale) - digits.size(), '0');
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out += digits;
  return out;
}

}  // namespace common
}  // namespace paystream
