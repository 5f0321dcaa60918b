#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace payledger {
namespace common {
namespace log {

enum class Level : std::uint8_t {
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

// Diagnostics go to stderr; stdout carries the account report only.
void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool enabled(Level level) noexcept;

[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;
[[nodiscard]] std::string_view level_name(Level level) noexcept;

void write(Level level, std::string_view message);

inline void debug(std::string_view message) { write(Level::kDebug, message); }
inline void info(std::string_view message) { write(Level::kInfo, message); }
inline void warn(std::string_view message) { write(Level::kWarn, message); }
inline void error(std::string_view message) { write(Level::kError, message); }

}  // namespace log
}  // namespace common
}  // namespace payledger
