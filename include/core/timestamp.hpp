#pragma once

#include <chrono>
#include <cstdint>

namespace turnwise::core {

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

template <typename Duration>
inline float to_millis(const Duration duration) {
  return std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(duration).count();
}

}  // namespace turnwise::core
