#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace paystream {
namespace common {

// Signed fixed-point decimal with four fractional digits.
class Amount {
 public:
  static constexpr int kScale = 4;
  static constexpr std::int64_t kUnitsPerWhole = 10'000;

  constexpr Amount() noexcept = default;

  static constexpr Amount from_units(std::int64_t units) noexcept { return Amount{units}; }
  static constexpr Amount from_whole(std::int64_t whole) noexcept { return Amount{whole * kUnitsPerWhole}; }

  // Accepts an optional sign, digits and an optional fraction ("12", "-0.5", ".25").
  // Fractions longer than four digits are rounded half away from zero, except
  // that a non-zero value never rounds to zero: "0.00004" parses as 0.0001.
  static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return units_ > 0; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }

  // At least one and at most four fractional digits, trailing zeros trimmed.
  [[nodiscard]] std::string to_string() const;

  constexpr Amount& operator+=(Amount other) noexcept {
    units_ += other.units_;
    return *this;
  }
  constexpr Amount& operator-=(Amount other) noexcept {
    units_ -= other.units_;
    return *this;
  }

  // nullopt when the result does not fit in 64 bits.
  [[nodiscard]] constexpr std::optional<Amount> checked_add(Amount other) const noexcept {
    if ((other.units_ > 0 && units_ > kMaxUnits - other.units_) ||
        (other.units_ < 0 && units_ < kMinUnits - other.units_)) {
      return std::nullopt;
    }
    return Amount{units_ + other.units_};
  }
  [[nodiscard]] constexpr std::optional<Amount> checked_sub(Amount other) const noexcept {
    if ((other.units_ < 0 && units_ > kMaxUnits + other.units_) ||
        (other.units_ > 0 && units_ < kMinUnits + other.units_)) {
      return std::nullopt;
    }
    return Amount{units_ - other.units_};
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) noexcept { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) noexcept { return lhs -= rhs; }
  friend constexpr bool operator==(Amount, Amount) noexcept = default;
  friend constexpr std::strong_ordering operator<=>(Amount, Amount) noexcept = default;

 private:
  static constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();
  static constexpr std::int64_t kMinUnits = std::numeric_limits<std::int64_t>::min();

  constexpr explicit Amount(std::int64_t units) noexcept : units_(units) {}

  std::int64_t units_{0};
};

}  // namespace common
}  // namespace paystream
