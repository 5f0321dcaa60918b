#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "payledger/ingest/transaction_record.hpp"

namespace payledger {
namespace ingest {

struct ReaderOptions {
  char delimiter{','};
};

struct ReaderStats {
  std::size_t rows{0};
  std::size_t accepted{0};
  std::size_t malformed{0};
};

// Reads a header line naming the columns (type, client, tx and optionally
// amount, in any order) followed by one record per line. Fields are trimmed
// and unquoted, and blank lines skipped. Rows that do not parse are counted
// and skipped.
class CsvReader {
 public:
  explicit CsvReader(std::istream& input, ReaderOptions options = {});

  // Returns false once the input is exhausted.
  bool next(TransactionRecord& out_record);

  [[nodiscard]] const ReaderStats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::size_t line_number() const noexcept { return line_number_; }

 private:
  struct ColumnLayout {
    std::size_t type{0};
    std::size_t client{0};
    std::size_t tx{0};
    std::optional<std::size_t> amount{};
    std::size_t width{0};
  };

  bool read_line(std::string& line);
  void read_header();
  std::optional<TransactionRecord> parse_row(const std::string& line) const;

  std::istream& input_;
  ReaderOptions options_{};
  std::optional<ColumnLayout> layout_{};
  bool header_read_{false};
  std::size_t line_number_{0};
  ReaderStats stats_{};
};

// Splits on `delimiter` and trims ASCII whitespace from each field. A field
// wrapped in double quotes is unwrapped; quoted delimiters are not supported.
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view line, char delimiter);

}  // namespace ingest
}  // namespace payledger
