#include "payledger/ledger/command.hpp"

namespace payledger {
namespace ledger {

std::optional<Command> make_deposit(common::ClientId client, common::TransactionId tx,
                                    common::Amount amount) {
  if (!amount.is_positive()) {
    return std::nullopt;
  }
  return Command{Deposit{.client = client, .tx = tx, .amount = amount}};
}

std::optional<Command> make_withdrawal(common::ClientId client, common::TransactionId tx,
                                       common::Amount amount) {
  if (!amount.is_positive()) {
    return std::nullopt;
  }
  return Command{Withdrawal{.client = client, .tx = tx, .amount = amount}};
}

Command make_dispute(common::ClientId client, common::TransactionId tx) {
  return Dispute{.client = client, .tx = tx};
}

Command make_resolve(common::ClientId client, common::TransactionId tx) {
  return Resolve{.client = client, .tx = tx};
}

Command make_chargeback(common::ClientId client, common::TransactionId tx) {
  return Chargeback{.client = client, .tx = tx};
}

common::ClientId client_of(const Command& command) noexcept {
  return std::visit([](const auto& cmd) { return cmd.client; }, command);
}

common::TransactionId transaction_of(const Command& command) noexcept {
  return std::visit([](const auto& cmd) { return cmd.tx; }, command);
}

}  // namespace ledger
}  // namespace payledger
