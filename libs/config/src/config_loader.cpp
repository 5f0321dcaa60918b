#include "payledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

#include "payledger/common/log.hpp"

namespace payledger {
namespace config {

namespace {

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.delimiter = get_str_or(*input, "delimiter", cfg.delimiter);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.include_header = get_bool_or(*output, "include_header", cfg.include_header);
  }
  return cfg;
}

LogConfig parse_log(const toml::table& root) {
  LogConfig cfg;
  if (auto* log = root["log"].as_table()) {
    cfg.level = get_str_or(*log, "level", cfg.level);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

AuditConfig parse_audit(const toml::table& root) {
  AuditConfig cfg;
  if (auto* audit = root["audit"].as_table()) {
    cfg.state_root = get_bool_or(*audit, "state_root", cfg.state_root);
  }
  return cfg;
}

ToolConfig parse_config(const toml::table& root) {
  ToolConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.log = parse_log(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.audit = parse_audit(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const ToolConfig& config) {
  std::vector<ValidationError> errors;

  const auto& delimiter = config.input.delimiter;
  if (delimiter.size() != 1) {
    errors.push_back({"input.delimiter", "must be exactly one character"});
  } else if ((delimiter[0] >= '0' && delimiter[0] <= '9') || delimiter[0] == '.' ||
             delimiter[0] == '"' || delimiter[0] == '-' || delimiter[0] == '+') {
    errors.push_back({"input.delimiter", "cannot be a digit, sign, '.' or '\"'"});
  }

  if (!common::log::parse_level(config.log.level)) {
    errors.push_back({"log.level", "must be one of debug, info, warn, error, off"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# Payments ledger configuration
# Generated default configuration

[input]
delimiter = ","

[output]
include_header = true

[log]
level = "warn"   # debug | info | warn | error | off

[telemetry]
enabled = false  # outcome counters logged at info when the run ends

[audit]
state_root = false  # log a BLAKE2b digest of the final account table
)";
}

}  // namespace config
}  // namespace payledger
