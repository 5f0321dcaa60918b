#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"
#include "payledger/ledger/account.hpp"
#include "payledger/ledger/command.hpp"
#include "payledger/ledger/outcome.hpp"
#include "payledger/ledger/transaction.hpp"

namespace payledger {
namespace ledger {

inline constexpr int kDisplayPrecision = 4;

struct AccountSnapshot {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

// Owns the account table and the transaction history. Commands must be
// applied in input order; a rejected command leaves both tables untouched.
class LedgerState {
 public:
  [[nodiscard]] ApplyResult apply(const Command& command);

  [[nodiscard]] const Account* find_account(common::ClientId client) const;
  [[nodiscard]] const HistoricalTransaction* find_transaction(common::TransactionId tx) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }
  [[nodiscard]] std::size_t transaction_count() const noexcept { return history_.size(); }

  // Every account ever created, ascending by client, rounded for display.
  [[nodiscard]] std::vector<AccountSnapshot> snapshot() const;

 private:
  ApplyResult apply_deposit(const Deposit& deposit);
  ApplyResult apply_withdrawal(const Withdrawal& withdrawal);
  ApplyResult apply_dispute(const Dispute& dispute);
  ApplyResult apply_resolve(const Resolve& resolve);
  ApplyResult apply_chargeback(const Chargeback& chargeback);

  Account* find_account_mut(common::ClientId client);

  std::unordered_map<common::ClientId, Account> accounts_{};
  std::unordered_map<common::TransactionId, HistoricalTransaction> history_{};
};

}  // namespace ledger
}  // namespace payledger
