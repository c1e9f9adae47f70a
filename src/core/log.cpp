#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace turnwise::core {
namespace {

std::atomic<int> g_min_level{static_cast<int>(log_level::INFO)};
std::mutex g_stderr_mutex;

}  // namespace

void set_log_level(const log_level level) noexcept { g_min_level.store(static_cast<int>(level)); }

bool log_enabled(const log_level level) noexcept { return static_cast<int>(level) >= g_min_level.load(); }

void log_line(const log_level level, const std::string_view tag, const std::string_view message) {
  if (!log_enabled(level)) {
    return;
  }
  const std::lock_guard<std::mutex> lock(g_stderr_mutex);
  std::cerr << '[' << tag << "] " << message << '\n';
}

}  // namespace turnwise::core
