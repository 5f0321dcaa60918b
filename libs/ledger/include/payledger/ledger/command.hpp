#pragma once

#include <optional>
#include <variant>

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

struct Deposit {
  common::ClientId client{0};
  common::TransactionId tx{0};
  common::Amount amount{};
};

struct Withdrawal {
  common::ClientId client{0};
  common::TransactionId tx{0};
  common::Amount amount{};
};

struct Dispute {
  common::ClientId client{0};
  common::TransactionId tx{0};
};

struct Resolve {
  common::ClientId client{0};
  common::TransactionId tx{0};
};

struct Chargeback {
  common::ClientId client{0};
  common::TransactionId tx{0};
};

using Command = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

// Deposit and withdrawal factories return nullopt for a non-positive amount.
[[nodiscard]] std::optional<Command> make_deposit(common::ClientId client, common::TransactionId tx,
                                                  common::Amount amount);
[[nodiscard]] std::optional<Command> make_withdrawal(common::ClientId client, common::TransactionId tx,
                                                     common::Amount amount);
[[nodiscard]] Command make_dispute(common::ClientId client, common::TransactionId tx);
[[nodiscard]] Command make_resolve(common::ClientId client, common::TransactionId tx);
[[nodiscard]] Command make_chargeback(common::ClientId client, common::TransactionId tx);

[[nodiscard]] common::ClientId client_of(const Command& command) noexcept;
[[nodiscard]] common::TransactionId transaction_of(const Command& command) noexcept;

}  // namespace ledger
}  // namespace payledger
