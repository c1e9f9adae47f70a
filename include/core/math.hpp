#pragma once

#include <algorithm>

namespace turnwise::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

}  // namespace turnwise::core
