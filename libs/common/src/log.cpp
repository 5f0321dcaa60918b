#include "payledger/common/log.hpp"

#include <iostream>
#include <mutex>

namespace payledger {
namespace common {
namespace log {

namespace {

std::mutex g_mutex;
Level g_level = Level::kWarn;

}  // namespace

void set_level(Level level) noexcept {
  std::scoped_lock lock(g_mutex);
  g_level = level;
}

Level level() noexcept {
  std::scoped_lock lock(g_mutex);
  return g_level;
}

bool enabled(Level level) noexcept {
  return level != Level::kOff && level >= log::level();
}

std::optional<Level> parse_level(std::string_view name) noexcept {
  if (name == "debug") return Level::kDebug;
  if (name == "info") return Level::kInfo;
  if (name == "warn" || name == "warning") return Level::kWarn;
  if (name == "error") return Level::kError;
  if (name == "off") return Level::kOff;
  return std::nullopt;
}

std::string_view level_name(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
    case Level::kOff:
      return "off";
  }
  return "unknown";
}

void write(Level level, std::string_view message) {
  if (!enabled(level)) {
    return;
  }
  std::scoped_lock lock(g_mutex);
  std::cerr << '[' << level_name(level) << "] " << message << '\n';
}

}  // namespace log
}  // namespace common
}  // namespace payledger
