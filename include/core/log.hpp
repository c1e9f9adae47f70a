#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace turnwise::core {

enum class log_level : std::uint8_t {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
};

void set_log_level(log_level level) noexcept;
[[nodiscard]] bool log_enabled(log_level level) noexcept;

// Writes "[tag] message" to stderr. Safe to call from any agent thread.
void log_line(log_level level, std::string_view tag, std::string_view message);

template <typename... Parts>
void log(const log_level level, const std::string_view tag, const Parts&... parts) {
  if (!log_enabled(level)) {
    return;
  }
  std::ostringstream out;
  (out << ... << parts);
  log_line(level, tag, out.str());
}

}  // namespace turnwise::core
