#pragma once

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

// available and held may each go negative after a dispute of funds that
// already left the account; neither is clamped.
struct Account {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  bool frozen{false};

  [[nodiscard]] common::Amount total() const noexcept { return available + held; }
};

}  // namespace ledger
}  // namespace payledger
