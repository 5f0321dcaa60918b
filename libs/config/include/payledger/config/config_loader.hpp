#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace payledger {
namespace config {

struct InputConfig {
  std::string delimiter{","};
};

struct OutputConfig {
  bool include_header{true};
};

struct LogConfig {
  std::string level{"warn"};
};

struct TelemetryConfig {
  bool enabled{false};
};

struct AuditConfig {
  bool state_root{false};
};

struct ToolConfig {
  InputConfig input;
  OutputConfig output;
  LogConfig log;
  TelemetryConfig telemetry;
  AuditConfig audit;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  ToolConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const ToolConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace payledger
