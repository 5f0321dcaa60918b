#include "test_ledger.hpp"

#include <cassert>
#include <cstdint>
#include "payledger/ledger/ledger_state.hpp"

namespace payledger::tests {

namespace {

using common::Amount;
using ledger::Outcome;

Amount amt(const char* text) {
  return *Amount::parse(text);
}

Outcome deposit(ledger::LedgerState& state, common::ClientId client, common::TransactionId tx, const char* amount) {
  return state.apply(ledger::Deposit{.client = client, .tx = tx, .amount = amt(amount)}).outcome;
}

Outcome withdraw(ledger::LedgerState& state, common::ClientId client, common::TransactionId tx, const char* amount) {
  return state.apply(ledger::Withdrawal{.client = client, .tx = tx, .amount = amt(amount)}).outcome;
}

Outcome dispute(ledger::LedgerState& state, common::ClientId client, common::TransactionId tx) {
  return state.apply(ledger::make_dispute(client, tx)).outcome;
}

Outcome resolve(ledger::LedgerState& state, common::ClientId client, common::TransactionId tx) {
  return state.apply(ledger::make_resolve(client, tx)).outcome;
}

Outcome chargeback(ledger::LedgerState& state, common::ClientId client, common::TransactionId tx) {
  return state.apply(ledger::make_chargeback(client, tx)).outcome;
}

void expect_balances(const ledger::LedgerState& state, common::ClientId client, const char* available,
                     const char* held) {
  const auto* account = state.find_account(client);
  assert(account != nullptr);
  assert(account->available == amt(available));
  assert(account->held == amt(held));
}

}  // namespace

void test_ledger_deposit() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100.0") == Outcome::kApplied);
  expect_balances(state, 1, "100", "0");
  assert(state.find_account(1)->total() == amt("100"));
  assert(!state.find_account(1)->frozen);

  const auto* entry = state.find_transaction(1);
  assert(entry != nullptr);
  assert(entry->kind == ledger::TransactionKind::kDeposit);
  assert(entry->status == ledger::DisputeStatus::kNormal);

  // The engine re-checks amounts that bypassed the command factories.
  auto result = state.apply(ledger::Deposit{.client = 1, .tx = 2, .amount = Amount{}});
  assert(result.outcome == Outcome::kInvalidAmount);
  assert(result.tx == 2);
  assert(withdraw(state, 1, 3, "-5") == Outcome::kInvalidAmount);
  assert(state.transaction_count() == 1);
  expect_balances(state, 1, "100", "0");

  assert(!ledger::make_deposit(1, 4, Amount{}));
  assert(!ledger::make_withdrawal(1, 4, amt("-1")));
  assert(ledger::make_deposit(1, 4, amt("0.0001")));
}

void test_ledger_duplicate_ids() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100.0") == Outcome::kApplied);

  auto result = state.apply(ledger::Deposit{.client = 1, .tx = 1, .amount = amt("50.0")});
  assert(result.outcome == Outcome::kDuplicate);
  assert(result.tx == 1);
  expect_balances(state, 1, "100", "0");

  // Reuse across kinds and clients is a duplicate too.
  assert(withdraw(state, 1, 1, "10") == Outcome::kDuplicate);
  assert(deposit(state, 2, 1, "10") == Outcome::kDuplicate);
  expect_balances(state, 1, "100", "0");
  assert(state.find_account(2) == nullptr);
  assert(state.transaction_count() == 1);
}

void test_ledger_withdrawal() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100") == Outcome::kApplied);
  assert(withdraw(state, 1, 2, "50") == Outcome::kApplied);
  expect_balances(state, 1, "50", "0");

  assert(withdraw(state, 1, 3, "150") == Outcome::kInsufficientFunds);
  expect_balances(state, 1, "50", "0");
  assert(state.find_transaction(3) == nullptr);

  // Exact balance may be withdrawn.
  assert(withdraw(state, 1, 4, "50") == Outcome::kApplied);
  expect_balances(state, 1, "0", "0");
  assert(state.find_transaction(4)->kind == ledger::TransactionKind::kWithdrawal);
}

void test_ledger_only_deposit_creates_account() {
  ledger::LedgerState state;
  assert(withdraw(state, 9, 1, "10.0") == Outcome::kMissingAccount);
  assert(dispute(state, 9, 1) == Outcome::kInvalidTransaction);
  assert(resolve(state, 9, 1) == Outcome::kInvalidTransaction);
  assert(chargeback(state, 9, 1) == Outcome::kInvalidTransaction);
  assert(state.find_account(9) == nullptr);
  assert(state.account_count() == 0);
  assert(state.transaction_count() == 0);

  assert(deposit(state, 9, 1, "1") == Outcome::kApplied);
  assert(state.find_account(9)->client == 9);
}

void test_ledger_dispute_resolve() {
  ledger::LedgerState state;
  assert(dispute(state, 1, 1) == Outcome::kInvalidTransaction);

  assert(deposit(state, 1, 1, "100.1234") == Outcome::kApplied);
  assert(withdraw(state, 1, 2, "50") == Outcome::kApplied);
  assert(resolve(state, 1, 1) == Outcome::kInvalidTransaction);

  assert(dispute(state, 1, 1) == Outcome::kApplied);
  assert(state.find_transaction(1)->under_dispute());
  expect_balances(state, 1, "-50", "100.1234");
  assert(state.find_account(1)->total() == amt("50.1234"));

  assert(dispute(state, 1, 1) == Outcome::kDuplicate);
  expect_balances(state, 1, "-50", "100.1234");

  assert(resolve(state, 1, 1) == Outcome::kApplied);
  assert(state.find_transaction(1)->status == ledger::DisputeStatus::kNormal);
  expect_balances(state, 1, "50.1234", "0");
  assert(resolve(state, 1, 1) == Outcome::kInvalidTransaction);

  // A resolved transaction may be disputed again.
  assert(dispute(state, 1, 1) == Outcome::kApplied);
  assert(resolve(state, 1, 1) == Outcome::kApplied);
  expect_balances(state, 1, "50.1234", "0");
}

void test_ledger_dispute_withdrawal() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100.0") == Outcome::kApplied);
  assert(withdraw(state, 1, 2, "50.0") == Outcome::kApplied);

  assert(dispute(state, 1, 2) == Outcome::kApplied);
  expect_balances(state, 1, "100", "-50");

  assert(resolve(state, 1, 2) == Outcome::kApplied);
  expect_balances(state, 1, "50", "0");

  assert(dispute(state, 1, 2) == Outcome::kApplied);
  assert(chargeback(state, 1, 2) == Outcome::kApplied);
  expect_balances(state, 1, "100", "-100");
  assert(state.find_account(1)->frozen);
}

void test_ledger_chargeback() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100.0") == Outcome::kApplied);
  assert(withdraw(state, 1, 2, "50.0") == Outcome::kApplied);

  assert(chargeback(state, 1, 3) == Outcome::kInvalidTransaction);
  assert(chargeback(state, 1, 1) == Outcome::kInvalidTransaction);
  assert(!state.find_account(1)->frozen);

  assert(dispute(state, 1, 1) == Outcome::kApplied);
  expect_balances(state, 1, "-50", "100");

  auto result = state.apply(ledger::make_chargeback(1, 1));
  assert(result.ok());
  expect_balances(state, 1, "-50", "0");
  assert(state.find_account(1)->frozen);
  assert(state.find_transaction(1)->charged_back());

  // Terminal: nothing further may move the entry.
  assert(chargeback(state, 1, 1) == Outcome::kDuplicate);
  assert(dispute(state, 1, 1) == Outcome::kDisputeChargeback);
  assert(resolve(state, 1, 1) == Outcome::kInvalidTransaction);
  expect_balances(state, 1, "-50", "0");
  assert(state.find_transaction(1)->charged_back());
}

void test_ledger_client_mismatch() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100") == Outcome::kApplied);
  assert(deposit(state, 2, 2, "10") == Outcome::kApplied);

  auto result = state.apply(ledger::make_dispute(2, 1));
  assert(result.outcome == Outcome::kInvalidTransaction);
  assert(result.tx == 1);
  expect_balances(state, 1, "100", "0");
  expect_balances(state, 2, "10", "0");

  assert(dispute(state, 1, 1) == Outcome::kApplied);
  assert(resolve(state, 2, 1) == Outcome::kInvalidTransaction);
  assert(chargeback(state, 2, 1) == Outcome::kInvalidTransaction);
  expect_balances(state, 1, "0", "100");
  expect_balances(state, 2, "10", "0");
  assert(!state.find_account(1)->frozen);
  assert(!state.find_account(2)->frozen);
}

void test_ledger_frozen_account() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "100.0") == Outcome::kApplied);
  assert(deposit(state, 1, 2, "100.0") == Outcome::kApplied);
  assert(dispute(state, 1, 1) == Outcome::kApplied);
  assert(chargeback(state, 1, 1) == Outcome::kApplied);
  expect_balances(state, 1, "100", "0");
  assert(state.find_account(1)->frozen);

  assert(withdraw(state, 1, 3, "1") == Outcome::kFrozenAccount);
  assert(state.find_transaction(3) == nullptr);
  assert(deposit(state, 1, 4, "100.0") == Outcome::kApplied);
  expect_balances(state, 1, "200", "0");

  // Disputes still operate on a frozen account; the lock never lifts.
  assert(dispute(state, 1, 4) == Outcome::kApplied);
  assert(resolve(state, 1, 4) == Outcome::kApplied);
  assert(state.find_account(1)->frozen);
}

void test_ledger_snapshot_order() {
  ledger::LedgerState state;
  assert(deposit(state, 300, 1, "1.00005") == Outcome::kApplied);
  assert(deposit(state, 2, 2, "2.5") == Outcome::kApplied);
  assert(deposit(state, 17, 3, "3") == Outcome::kApplied);
  assert(dispute(state, 17, 3) == Outcome::kApplied);
  assert(chargeback(state, 17, 3) == Outcome::kApplied);

  const auto rows = state.snapshot();
  assert(rows.size() == 3);
  assert(rows[0].client == 2);
  assert(rows[1].client == 17);
  assert(rows[2].client == 300);

  assert(rows[1].locked);
  assert(rows[1].total.is_zero());
  assert(rows[2].available == amt("1.0000"));
  assert(rows[2].total == amt("1.0000"));

  // Rounding is display-only.
  assert(state.find_account(300)->available == amt("1.00005"));
}

void test_ledger_balance_consistency() {
  ledger::LedgerState state;
  Amount deposited{};
  Amount withdrawn{};
  for (common::TransactionId tx = 1; tx <= 200; ++tx) {
    const auto client = static_cast<common::ClientId>(tx % 7);
    const auto amount = Amount::from_units(static_cast<std::int64_t>(tx) * 1'234'567);
    if (tx % 3 == 0) {
      if (state.apply(ledger::Withdrawal{.client = client, .tx = tx, .amount = amount}).ok()) {
        withdrawn += amount;
      }
    } else {
      assert(state.apply(ledger::Deposit{.client = client, .tx = tx, .amount = amount}).ok());
      deposited += amount;
    }
    const auto previous_client = static_cast<common::ClientId>((tx - 1) % 7);
    if (tx % 5 == 0) {
      (void)state.apply(ledger::make_dispute(previous_client, tx - 1));
    }
    if (tx % 10 == 0) {
      (void)state.apply(ledger::make_resolve(previous_client, tx - 1));
    }
  }

  Amount total{};
  for (common::ClientId client = 0; client < 7; ++client) {
    if (const auto* account = state.find_account(client)) {
      total += account->total();
    }
  }
  assert(total == deposited - withdrawn);
}

void test_ledger_large_balances() {
  ledger::LedgerState state;
  assert(deposit(state, 1, 1, "92233720368") == Outcome::kApplied);
  assert(deposit(state, 1, 2, "92233720368") == Outcome::kApplied);
  assert(deposit(state, 2, 3, "92233720368.54775807") == Outcome::kApplied);
  assert(deposit(state, 3, 4, "999999999999999999.99999999") == Outcome::kApplied);
  assert(deposit(state, 3, 5, "999999999999999999.99999999") == Outcome::kApplied);
  assert(dispute(state, 3, 4) == Outcome::kApplied);

  const auto rows = state.snapshot();
  assert(rows.size() == 3);
  assert(rows[0].available.to_string(4) == "184467440736.0000");
  assert(rows[0].total.is_positive());
  assert(rows[1].available.to_string(4) == "92233720368.5478");
  assert(rows[2].available.to_string(4) == "1000000000000000000.0000");
  assert(rows[2].held.to_string(4) == "1000000000000000000.0000");
  assert(rows[2].total.to_string(4) == "2000000000000000000.0000");

  assert(withdraw(state, 1, 6, "184467440736") == Outcome::kApplied);
  expect_balances(state, 1, "0", "0");
}

}  // namespace payledger::tests
