#include "payledger/ledger/ledger_state.hpp"

#include <algorithm>
#include <variant>

namespace payledger {
namespace ledger {

namespace {

ApplyResult reject(Outcome outcome, common::TransactionId tx) {
  return ApplyResult{.outcome = outcome, .tx = tx};
}

ApplyResult applied(common::TransactionId tx) {
  return ApplyResult{.outcome = Outcome::kApplied, .tx = tx};
}

}  // namespace

ApplyResult LedgerState::apply(const Command& command) {
  struct Dispatcher {
    LedgerState& state;
    ApplyResult operator()(const Deposit& cmd) const { return state.apply_deposit(cmd); }
    ApplyResult operator()(const Withdrawal& cmd) const { return state.apply_withdrawal(cmd); }
    ApplyResult operator()(const Dispute& cmd) const { return state.apply_dispute(cmd); }
    ApplyResult operator()(const Resolve& cmd) const { return state.apply_resolve(cmd); }
    ApplyResult operator()(const Chargeback& cmd) const { return state.apply_chargeback(cmd); }
  };
  return std::visit(Dispatcher{*this}, command);
}

const Account* LedgerState::find_account(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

const HistoricalTransaction* LedgerState::find_transaction(common::TransactionId tx) const {
  if (auto it = history_.find(tx); it != history_.end()) {
    return &it->second;
  }
  return nullptr;
}

Account* LedgerState::find_account_mut(common::ClientId client) {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::vector<AccountSnapshot> LedgerState::snapshot() const {
  std::vector<AccountSnapshot> rows;
  rows.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    rows.push_back(AccountSnapshot{
        .client = client,
        .available = account.available.round(kDisplayPrecision),
        .held = account.held.round(kDisplayPrecision),
        .total = account.total().round(kDisplayPrecision),
        .locked = account.frozen,
    });
  }
  std::sort(rows.begin(), rows.end(),
            [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) { return lhs.client < rhs.client; });
  return rows;
}

// Deposits and withdrawals share one check order: amount, duplicate id, then
// account state.

ApplyResult LedgerState::apply_deposit(const Deposit& deposit) {
  if (!deposit.amount.is_positive()) {
    return reject(Outcome::kInvalidAmount, deposit.tx);
  }
  if (history_.contains(deposit.tx)) {
    return reject(Outcome::kDuplicate, deposit.tx);
  }

  auto& account = accounts_.try_emplace(deposit.client, Account{.client = deposit.client}).first->second;
  account.available += deposit.amount;

  history_.emplace(deposit.tx, HistoricalTransaction{
                                   .kind = TransactionKind::kDeposit,
                                   .client = deposit.client,
                                   .amount = deposit.amount,
                               });
  return applied(deposit.tx);
}

ApplyResult LedgerState::apply_withdrawal(const Withdrawal& withdrawal) {
  if (!withdrawal.amount.is_positive()) {
    return reject(Outcome::kInvalidAmount, withdrawal.tx);
  }
  if (history_.contains(withdrawal.tx)) {
    return reject(Outcome::kDuplicate, withdrawal.tx);
  }

  Account* account = find_account_mut(withdrawal.client);
  if (!account) {
    return reject(Outcome::kMissingAccount, withdrawal.tx);
  }
  if (account->frozen) {
    return reject(Outcome::kFrozenAccount, withdrawal.tx);
  }
  if (account->available < withdrawal.amount) {
    return reject(Outcome::kInsufficientFunds, withdrawal.tx);
  }

  account->available -= withdrawal.amount;
  history_.emplace(withdrawal.tx, HistoricalTransaction{
                                      .kind = TransactionKind::kWithdrawal,
                                      .client = withdrawal.client,
                                      .amount = withdrawal.amount,
                                  });
  return applied(withdrawal.tx);
}

ApplyResult LedgerState::apply_dispute(const Dispute& dispute) {
  auto it = history_.find(dispute.tx);
  if (it == history_.end() || it->second.client != dispute.client) {
    return reject(Outcome::kInvalidTransaction, dispute.tx);
  }

  auto& entry = it->second;
  if (entry.charged_back()) {
    return reject(Outcome::kDisputeChargeback, dispute.tx);
  }
  if (entry.under_dispute()) {
    return reject(Outcome::kDuplicate, dispute.tx);
  }

  Account* account = find_account_mut(entry.client);
  if (!account) {
    return reject(Outcome::kMissingAccount, dispute.tx);
  }

  const common::Amount moved = entry.disputed_amount();
  account->available -= moved;
  account->held += moved;
  entry.status = DisputeStatus::kDisputed;
  return applied(dispute.tx);
}

ApplyResult LedgerState::apply_resolve(const Resolve& resolve) {
  auto it = history_.find(resolve.tx);
  if (it == history_.end() || it->second.client != resolve.client) {
    return reject(Outcome::kInvalidTransaction, resolve.tx);
  }

  auto& entry = it->second;
  if (!entry.under_dispute()) {
    return reject(Outcome::kInvalidTransaction, resolve.tx);
  }

  Account* account = find_account_mut(entry.client);
  if (!account) {
    return reject(Outcome::kMissingAccount, resolve.tx);
  }

  const common::Amount moved = entry.disputed_amount();
  account->available += moved;
  account->held -= moved;
  entry.status = DisputeStatus::kNormal;
  return applied(resolve.tx);
}

ApplyResult LedgerState::apply_chargeback(const Chargeback& chargeback) {
  auto it = history_.find(chargeback.tx);
  if (it == history_.end() || it->second.client != chargeback.client) {
    return reject(Outcome::kInvalidTransaction, chargeback.tx);
  }

  auto& entry = it->second;
  if (entry.charged_back()) {
    return reject(Outcome::kDuplicate, chargeback.tx);
  }
  if (!entry.under_dispute()) {
    return reject(Outcome::kInvalidTransaction, chargeback.tx);
  }

  Account* account = find_account_mut(entry.client);
  if (!account) {
    return reject(Outcome::kMissingAccount, chargeback.tx);
  }

  // The original amount leaves held regardless of kind.
  account->held -= entry.amount;
  account->frozen = true;
  entry.status = DisputeStatus::kChargedBack;
  return applied(chargeback.tx);
}

}  // namespace ledger
}  // namespace payledger
