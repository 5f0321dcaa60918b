#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace payledger {
namespace common {

// Exact base-10 fixed-point value held as a signed 128-bit count of 10^-8
// units. Arithmetic never rounds; rounding happens only through
// round()/to_string().
//
// parse() caps the whole part at kMaxWholeDigits digits (< 10^26 units). The
// ledger holds at most 2^32 transactions, and every balance stays within
// 3 * 2^32 * 10^26 < 2^127. Sums of parsed amounts therefore never overflow.
class Amount {
 public:
  __extension__ typedef __int128 Units;

  static constexpr int kFractionDigits = 8;
  static constexpr int kMaxWholeDigits = 18;
  static constexpr std::int64_t kUnitsPerWhole = 100'000'000;

  constexpr Amount() noexcept = default;

  static constexpr Amount from_units(Units units) noexcept { return Amount{units}; }
  static constexpr Amount from_whole(std::int64_t whole) noexcept {
    return Amount{static_cast<Units>(whole) * kUnitsPerWhole};
  }

  // Accepts [+-]digits[.digits]. Fractional digits beyond kFractionDigits are
  // rounded half-to-even.
  static std::optional<Amount> parse(std::string_view text) noexcept;

  [[nodiscard]] constexpr Units units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return units_ > 0; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }

  // Round-half-to-even to `places` fractional digits (0..kFractionDigits).
  [[nodiscard]] Amount round(int places) const noexcept;

  // Rounds to `places` and renders exactly that many fractional digits.
  [[nodiscard]] std::string to_string(int places = kFractionDigits) const;

  constexpr Amount operator-() const noexcept { return Amount{-units_}; }
  constexpr Amount operator+(Amount other) const noexcept { return Amount{units_ + other.units_}; }
  constexpr Amount operator-(Amount other) const noexcept { return Amount{units_ - other.units_}; }

  constexpr Amount& operator+=(Amount other) noexcept {
    units_ += other.units_;
    return *this;
  }

  constexpr Amount& operator-=(Amount other) noexcept {
    units_ -= other.units_;
    return *this;
  }

  constexpr bool operator==(const Amount&) const noexcept = default;
  constexpr auto operator<=>(const Amount&) const noexcept = default;

 private:
  constexpr explicit Amount(Units units) noexcept : units_(units) {}

  Units units_{0};
};

}  // namespace common
}  // namespace payledger
