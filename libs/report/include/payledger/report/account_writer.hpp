#pragma once

#include <ostream>
#include <span>

#include "payledger/ledger/ledger_state.hpp"

namespace payledger {
namespace report {

struct WriterOptions {
  bool include_header{true};
};

// Writes "client,available,held,total,locked" rows in the order given.
// Amounts carry exactly four fractional digits; locked is true/false.
void write_accounts(std::ostream& out, std::span<const ledger::AccountSnapshot> rows,
                    WriterOptions options = {});

}  // namespace report
}  // namespace payledger
