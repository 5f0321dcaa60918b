#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

#include "payledger/ledger/ledger_state.hpp"

namespace payledger {
namespace ledger {

inline constexpr std::size_t kStateRootSize = 32;

using StateRoot = std::array<std::uint8_t, kStateRootSize>;

// BLAKE2b-256 over the canonical rendering of the snapshot rows
// ("client|available|held|total|locked\n", four fractional digits each).
// Identical final states yield identical roots.
[[nodiscard]] StateRoot compute_state_root(std::span<const AccountSnapshot> rows);

[[nodiscard]] std::string to_hex(const StateRoot& root);

}  // namespace ledger
}  // namespace payledger
