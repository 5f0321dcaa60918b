#include "payledger/common/amount.hpp"

#include <algorithm>

namespace payledger {
namespace common {

namespace {

__extension__ typedef unsigned __int128 UnsignedUnits;

constexpr UnsignedUnits pow10(int exponent) noexcept {
  UnsignedUnits value = 1;
  for (int i = 0; i < exponent; ++i) {
    value *= 10;
  }
  return value;
}

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

UnsignedUnits magnitude_of(Amount::Units units) noexcept {
  return units < 0 ? UnsignedUnits{0} - static_cast<UnsignedUnits>(units) : static_cast<UnsignedUnits>(units);
}

// True when the digits dropped after `kept_last` push the value up under
// round-half-to-even.
bool rounds_up(std::string_view dropped, char kept_last) noexcept {
  if (dropped.front() != '5') {
    return dropped.front() > '5';
  }
  const bool beyond_half = std::any_of(dropped.begin() + 1, dropped.end(), [](char c) { return c != '0'; });
  return beyond_half || ((kept_last - '0') & 1) != 0;
}

}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) noexcept {
  bool negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  std::string_view whole = text;
  std::string_view fraction{};
  if (const auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
  }

  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (!std::all_of(whole.begin(), whole.end(), is_digit) ||
      !std::all_of(fraction.begin(), fraction.end(), is_digit)) {
    return std::nullopt;
  }

  const auto first_significant = whole.find_first_not_of('0');
  if (first_significant != std::string_view::npos &&
      whole.size() - first_significant > static_cast<std::size_t>(kMaxWholeDigits)) {
    return std::nullopt;
  }

  UnsignedUnits units = 0;
  for (char c : whole) {
    units = units * 10 + static_cast<UnsignedUnits>(c - '0');
  }

  std::string_view kept = fraction.substr(0, std::min<std::size_t>(fraction.size(), kFractionDigits));
  for (char c : kept) {
    units = units * 10 + static_cast<UnsignedUnits>(c - '0');
  }
  units *= pow10(kFractionDigits - static_cast<int>(kept.size()));

  if (fraction.size() > kept.size()) {
    const char kept_last = kept.back();
    if (rounds_up(fraction.substr(kept.size()), kept_last)) {
      ++units;
    }
  }

  const auto signed_units = static_cast<Units>(units);
  return Amount{negative ? -signed_units : signed_units};
}

Amount Amount::round(int places) const noexcept {
  places = std::clamp(places, 0, kFractionDigits);
  const UnsignedUnits step = pow10(kFractionDigits - places);
  if (step == 1) {
    return *this;
  }

  const UnsignedUnits magnitude = magnitude_of(units_);
  UnsignedUnits quotient = magnitude / step;
  const UnsignedUnits remainder = magnitude % step;
  const UnsignedUnits half = step / 2;
  if (remainder > half || (remainder == half && (quotient & 1U) != 0)) {
    ++quotient;
  }

  // magnitude < 2^127 - step, so the rounded value stays representable.
  const auto rounded = static_cast<Units>(quotient * step);
  return Amount{units_ < 0 ? -rounded : rounded};
}

std::string Amount::to_string(int places) const {
  places = std::clamp(places, 0, kFractionDigits);
  const Amount rounded = round(places);

  const UnsignedUnits magnitude = magnitude_of(rounded.units_);
  UnsignedUnits whole = magnitude / static_cast<UnsignedUnits>(kUnitsPerWhole);
  const auto fraction = static_cast<std::uint64_t>(magnitude % static_cast<UnsignedUnits>(kUnitsPerWhole));

  std::string whole_digits;
  do {
    whole_digits.push_back(static_cast<char>('0' + static_cast<int>(whole % 10)));
    whole /= 10;
  } while (whole != 0);
  std::reverse(whole_digits.begin(), whole_digits.end());

  std::string out;
  if (rounded.units_ < 0) {
    out.push_back('-');
  }
  out += whole_digits;
  if (places == 0) {
    return out;
  }

  std::string digits = std::to_string(fraction);
  digits.insert(0, static_cast<std::size_t>(kFractionDigits) - digits.size(), '0');
  out.push_back('.');
  out.append(digits, 0, static_cast<std::size_t>(places));
  return out;
}

}  // namespace common
}  // namespace payledger
