#include "payledger/replay/replay_driver.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "payledger/common/log.hpp"
#include "payledger/ledger/outcome.hpp"

namespace payledger {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path input_path, ingest::ReaderOptions options) {
  input_path_ = std::move(input_path);
  options_ = options;
}

void Driver::set_command_handler(CommandHandler handler) {
  command_handler_ = std::move(handler);
}

ReplayStats Driver::execute() {
  if (input_path_.empty()) {
    throw std::runtime_error("input path not set for replay");
  }
  if (std::filesystem::is_directory(input_path_)) {
    throw std::runtime_error("input path is a directory: " + input_path_.string());
  }

  std::ifstream input(input_path_);
  if (!input) {
    throw std::runtime_error("failed to open input: " + input_path_.string());
  }
  return execute(input);
}

ReplayStats Driver::execute(std::istream& input) {
  if (!command_handler_) {
    throw std::runtime_error("command handler not set for replay");
  }

  ReplayStats stats;
  ingest::CsvReader reader(input, options_);
  ingest::TransactionRecord record;
  while (reader.next(record)) {
    auto command = ingest::to_command(record);
    if (!command) {
      ++stats.rejected_at_boundary;
      common::log::warn("unable to parse transaction: " +
                        ledger::describe({.outcome = ledger::Outcome::kInvalidAmount, .tx = record.tx}));
      continue;
    }
    ++stats.forwarded;
    command_handler_(*command);
  }

  if (input.bad()) {
    throw std::runtime_error("failed while reading input");
  }

  stats.rows = reader.stats().rows;
  stats.malformed = reader.stats().malformed;
  return stats;
}

}  // namespace replay
}  // namespace payledger
