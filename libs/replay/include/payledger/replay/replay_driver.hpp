#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>

#include "payledger/ingest/csv_reader.hpp"
#include "payledger/ledger/command.hpp"

namespace payledger {
namespace replay {

struct ReplayStats {
  std::size_t rows{0};
  std::size_t malformed{0};
  std::size_t rejected_at_boundary{0};
  std::size_t forwarded{0};
};

// Streams input records, in order, through boundary validation into the
// command handler.
class Driver {
 public:
  using CommandHandler = std::function<void(const ledger::Command&)>;

  Driver();

  void configure(std::filesystem::path input_path, ingest::ReaderOptions options = {});
  void set_command_handler(CommandHandler handler);

  // Throws std::runtime_error when the input cannot be opened or read.
  ReplayStats execute();
  ReplayStats execute(std::istream& input);

 private:
  std::filesystem::path input_path_{};
  ingest::ReaderOptions options_{};
  CommandHandler command_handler_{};
};

}  // namespace replay
}  // namespace payledger
