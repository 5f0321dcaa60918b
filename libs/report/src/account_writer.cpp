#include "payledger/report/account_writer.hpp"

#include <stdexcept>

namespace payledger {
namespace report {

void write_accounts(std::ostream& out, std::span<const ledger::AccountSnapshot> rows,
                    WriterOptions options) {
  if (options.include_header) {
    out << "client,available,held,total,locked\n";
  }
  for (const auto& row : rows) {
    out << row.client << ','
        << row.available.to_string(ledger::kDisplayPrecision) << ','
        << row.held.to_string(ledger::kDisplayPrecision) << ','
        << row.total.to_string(ledger::kDisplayPrecision) << ','
        << (row.locked ? "true" : "false") << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
}

}  // namespace report
}  // namespace payledger
