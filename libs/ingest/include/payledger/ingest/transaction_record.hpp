#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"
#include "payledger/ledger/command.hpp"

namespace payledger {
namespace ingest {

enum class RecordKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

struct TransactionRecord {
  RecordKind kind{RecordKind::kDeposit};
  common::ClientId client{0};
  common::TransactionId tx{0};
  std::optional<common::Amount> amount{};
};

struct RawFields {
  std::string_view type{};
  std::string_view client{};
  std::string_view tx{};
  std::string_view amount{};
};

[[nodiscard]] std::optional<RecordKind> parse_kind(std::string_view text) noexcept;

// nullopt when any field fails to parse; an empty amount is kept as absent.
[[nodiscard]] std::optional<TransactionRecord> parse_record(const RawFields& fields) noexcept;

// Deposit and withdrawal records must carry a positive amount; nullopt otherwise.
[[nodiscard]] std::optional<ledger::Command> to_command(const TransactionRecord& record);

}  // namespace ingest
}  // namespace payledger
