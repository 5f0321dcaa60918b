#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "payledger/common/log.hpp"
#include "payledger/config/config_loader.hpp"
#include "payledger/ledger/ledger_state.hpp"
#include "payledger/ledger/outcome.hpp"
#include "payledger/ledger/state_root.hpp"
#include "payledger/replay/replay_driver.hpp"
#include "payledger/report/account_writer.hpp"
#include "payledger/telemetry/telemetry_sink.hpp"

namespace {

namespace log = payledger::common::log;

// Metric ids: one per ledger::Outcome, then the ingestion counters.
constexpr std::uint64_t kMetricRowsRead = 100;
constexpr std::uint64_t kMetricRowsMalformed = 101;
constexpr std::uint64_t kMetricBoundaryRejected = 102;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <input.csv> [config_file]\n"
            << "  input.csv:   transaction records (type,client,tx,amount)\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./payments.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./payments.toml",
      home ? std::filesystem::path{home} / ".config/payments/payments.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(const std::filesystem::path& config_path, payledger::config::ToolConfig& cfg) {
  using payledger::config::ConfigLoader;

  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

void register_metrics(payledger::telemetry::TelemetrySink& telemetry) {
  using payledger::ledger::Outcome;
  for (std::size_t i = 0; i < payledger::ledger::kOutcomeCount; ++i) {
    const auto outcome = static_cast<Outcome>(i);
    telemetry.register_metric(i, "commands." + std::string(payledger::ledger::outcome_name(outcome)));
  }
  telemetry.register_metric(kMetricRowsRead, "records.read");
  telemetry.register_metric(kMetricRowsMalformed, "records.malformed");
  telemetry.register_metric(kMetricBoundaryRejected, "records.rejected_at_boundary");
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payledger;

  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  const std::filesystem::path input_path{argv[1]};
  config::ToolConfig cfg;
  if (!load_config(find_config_path(argc, argv), cfg)) {
    return 1;
  }
  log::set_level(log::parse_level(cfg.log.level).value_or(log::Level::kWarn));

  ledger::LedgerState ledger;
  telemetry::TelemetrySink telemetry;
  register_metrics(telemetry);

  replay::Driver replay;
  replay.configure(input_path, ingest::ReaderOptions{.delimiter = cfg.input.delimiter.front()});
  replay.set_command_handler([&](const ledger::Command& command) {
    const auto result = ledger.apply(command);
    telemetry.increment(static_cast<std::uint64_t>(result.outcome));
    if (!result.ok()) {
      log::warn("unable to process transaction: " + ledger::describe(result));
    }
  });

  try {
    const auto stats = replay.execute();
    telemetry.increment(kMetricRowsRead, static_cast<std::int64_t>(stats.rows));
    telemetry.increment(kMetricRowsMalformed, static_cast<std::int64_t>(stats.malformed));
    telemetry.increment(kMetricBoundaryRejected, static_cast<std::int64_t>(stats.rejected_at_boundary));
  } catch (const std::exception& e) {
    std::cerr << "Replay failed: " << e.what() << "\n";
    return 1;
  }

  const auto accounts = ledger.snapshot();
  try {
    report::write_accounts(std::cout, accounts, report::WriterOptions{.include_header = cfg.output.include_header});
  } catch (const std::exception& e) {
    log::error(std::string("unable to write report: ") + e.what());
    return 1;
  }

  if (cfg.telemetry.enabled) {
    for (const auto& total : telemetry.totals()) {
      log::info(total.name + " = " + std::to_string(total.value));
    }
  }

  if (cfg.audit.state_root) {
    try {
      log::info("state root: " + ledger::to_hex(ledger::compute_state_root(accounts)));
    } catch (const std::exception& e) {
      log::error(std::string("unable to compute state root: ") + e.what());
      return 1;
    }
  }

  return 0;
}
