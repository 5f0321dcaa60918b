#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

enum class Outcome : std::uint8_t {
  kApplied,
  kInvalidAmount,
  kDuplicate,
  kInsufficientFunds,
  kMissingAccount,
  kInvalidTransaction,
  kDisputeChargeback,
  kFrozenAccount,
};

inline constexpr std::size_t kOutcomeCount = 8;

struct ApplyResult {
  Outcome outcome{Outcome::kApplied};
  common::TransactionId tx{0};

  [[nodiscard]] bool ok() const noexcept { return outcome == Outcome::kApplied; }
};

[[nodiscard]] std::string_view outcome_name(Outcome outcome) noexcept;
[[nodiscard]] std::string describe(const ApplyResult& result);

}  // namespace ledger
}  // namespace payledger
