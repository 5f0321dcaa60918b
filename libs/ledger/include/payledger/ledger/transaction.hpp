#pragma once

#include <cstdint>

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
};

// kNormal -> kDisputed -> {kNormal (resolve), kChargedBack (terminal)}
enum class DisputeStatus : std::uint8_t {
  kNormal,
  kDisputed,
  kChargedBack,
};

struct HistoricalTransaction {
  TransactionKind kind{TransactionKind::kDeposit};
  common::ClientId client{0};
  common::Amount amount{};
  DisputeStatus status{DisputeStatus::kNormal};

  [[nodiscard]] bool under_dispute() const noexcept { return status == DisputeStatus::kDisputed; }
  [[nodiscard]] bool charged_back() const noexcept { return status == DisputeStatus::kChargedBack; }

  // Amount moved from available into held when this entry is disputed.
  // A withdrawal moves the withdrawn funds back, so its contribution is negative.
  [[nodiscard]] common::Amount disputed_amount() const noexcept {
    return kind == TransactionKind::kDeposit ? amount : -amount;
  }
};

}  // namespace ledger
}  // namespace payledger
