#include "payledger/ingest/transaction_record.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace payledger {
namespace ingest {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
         });
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
  T value{};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RecordKind> parse_kind(std::string_view text) noexcept {
  if (iequals(text, "deposit")) return RecordKind::kDeposit;
  if (iequals(text, "withdrawal")) return RecordKind::kWithdrawal;
  if (iequals(text, "dispute")) return RecordKind::kDispute;
  if (iequals(text, "resolve")) return RecordKind::kResolve;
  if (iequals(text, "chargeback")) return RecordKind::kChargeback;
  return std::nullopt;
}

std::optional<TransactionRecord> parse_record(const RawFields& fields) noexcept {
  const auto kind = parse_kind(fields.type);
  const auto client = parse_unsigned<common::ClientId>(fields.client);
  const auto tx = parse_unsigned<common::TransactionId>(fields.tx);
  if (!kind || !client || !tx) {
    return std::nullopt;
  }

  TransactionRecord record{.kind = *kind, .client = *client, .tx = *tx};
  if (!fields.amount.empty()) {
    record.amount = common::Amount::parse(fields.amount);
    if (!record.amount) {
      return std::nullopt;
    }
  }
  return record;
}

std::optional<ledger::Command> to_command(const TransactionRecord& record) {
  switch (record.kind) {
    case RecordKind::kDeposit:
      if (!record.amount) {
        return std::nullopt;
      }
      return ledger::make_deposit(record.client, record.tx, *record.amount);
    case RecordKind::kWithdrawal:
      if (!record.amount) {
        return std::nullopt;
      }
      return ledger::make_withdrawal(record.client, record.tx, *record.amount);
    case RecordKind::kDispute:
      return ledger::make_dispute(record.client, record.tx);
    case RecordKind::kResolve:
      return ledger::make_resolve(record.client, record.tx);
    case RecordKind::kChargeback:
      return ledger::make_chargeback(record.client, record.tx);
  }
  return std::nullopt;
}

}  // namespace ingest
}  // namespace payledger
