#include "payledger/ingest/csv_reader.hpp"

#include <stdexcept>
#include <string_view>

#include "payledger/common/log.hpp"

namespace payledger {
namespace ingest {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

std::string_view trim(std::string_view text) noexcept {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

// Trims, then drops one pair of enclosing double quotes and trims the content.
std::string_view clean_field(std::string_view field) noexcept {
  field = trim(field);
  if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
    field = trim(field.substr(1, field.size() - 2));
  }
  return field;
}

bool is_blank(std::string_view line) noexcept {
  return line.find_first_not_of(kWhitespace) == std::string_view::npos;
}

}  // namespace

std::vector<std::string_view> split_fields(std::string_view line, char delimiter) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto pos = line.find(delimiter, start);
    if (pos == std::string_view::npos) {
      fields.push_back(clean_field(line.substr(start)));
      break;
    }
    fields.push_back(clean_field(line.substr(start, pos - start)));
    start = pos + 1;
  }
  return fields;
}

CsvReader::CsvReader(std::istream& input, ReaderOptions options)
    : input_(input), options_(options) {}

bool CsvReader::read_line(std::string& line) {
  while (std::getline(input_, line)) {
    ++line_number_;
    if (!is_blank(line)) {
      return true;
    }
  }
  return false;
}

void CsvReader::read_header() {
  header_read_ = true;

  std::string line;
  if (!read_line(line)) {
    return;
  }

  ColumnLayout layout;
  bool has_type = false;
  bool has_client = false;
  bool has_tx = false;

  const auto columns = split_fields(line, options_.delimiter);
  layout.width = columns.size();
  for (std::size_t i = 0; i < columns.size(); ++i) {
    const auto name = columns[i];
    if (name == "type") {
      layout.type = i;
      has_type = true;
    } else if (name == "client") {
      layout.client = i;
      has_client = true;
    } else if (name == "tx") {
      layout.tx = i;
      has_tx = true;
    } else if (name == "amount") {
      layout.amount = i;
    }
  }

  if (!has_type || !has_client || !has_tx) {
    throw std::runtime_error("input header must name type, client and tx columns: '" + line + "'");
  }
  layout_ = layout;
}

bool CsvReader::next(TransactionRecord& out_record) {
  if (!header_read_) {
    read_header();
  }
  if (!layout_) {
    return false;
  }

  std::string line;
  while (read_line(line)) {
    ++stats_.rows;
    if (auto record = parse_row(line)) {
      ++stats_.accepted;
      out_record = *record;
      return true;
    }
    ++stats_.malformed;
    if (common::log::enabled(common::log::Level::kDebug)) {
      common::log::debug("dropping malformed record at line " + std::to_string(line_number_) + ": '" +
                         line + "'");
    }
  }
  return false;
}

std::optional<TransactionRecord> CsvReader::parse_row(const std::string& line) const {
  const auto fields = split_fields(line, options_.delimiter);
  if (fields.size() > layout_->width) {
    return std::nullopt;
  }

  // Trailing columns may be left off entirely (e.g. "dispute,1,7").
  auto field = [&fields](std::size_t index) -> std::string_view {
    return index < fields.size() ? fields[index] : std::string_view{};
  };

  RawFields raw{
      .type = field(layout_->type),
      .client = field(layout_->client),
      .tx = field(layout_->tx),
      .amount = layout_->amount ? field(*layout_->amount) : std::string_view{},
  };
  return parse_record(raw);
}

}  // namespace ingest
}  // namespace payledger
