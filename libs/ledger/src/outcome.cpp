#include "payledger/ledger/outcome.hpp"

namespace payledger {
namespace ledger {

std::string_view outcome_name(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kInvalidAmount:
      return "invalid_amount";
    case Outcome::kDuplicate:
      return "duplicate";
    case Outcome::kInsufficientFunds:
      return "insufficient_funds";
    case Outcome::kMissingAccount:
      return "missing_account";
    case Outcome::kInvalidTransaction:
      return "invalid_transaction";
    case Outcome::kDisputeChargeback:
      return "dispute_chargeback";
    case Outcome::kFrozenAccount:
      return "frozen_account";
  }
  return "unknown";
}

std::string describe(const ApplyResult& result) {
  const std::string tx = std::to_string(result.tx);
  switch (result.outcome) {
    case Outcome::kApplied:
      return "transaction " + tx + " applied";
    case Outcome::kInvalidAmount:
      return "transaction " + tx + ": amount must be greater than 0";
    case Outcome::kDuplicate:
      return "transaction " + tx + " already processed";
    case Outcome::kInsufficientFunds:
      return "transaction " + tx + ": insufficient funds";
    case Outcome::kMissingAccount:
      return "transaction " + tx + ": no account for client";
    case Outcome::kInvalidTransaction:
      return "transaction " + tx + " is not valid for this operation";
    case Outcome::kDisputeChargeback:
      return "transaction " + tx + " was charged back and cannot be disputed";
    case Outcome::kFrozenAccount:
      return "transaction " + tx + ": account is frozen";
  }
  return "transaction " + tx + ": unknown outcome";
}

}  // namespace ledger
}  // namespace payledger
