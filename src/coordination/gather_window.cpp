#include "coordination/gather_window.hpp"

#include <algorithm>
#include <cmath>

namespace turnwise::coordination {

GatherWindow::GatherWindow(const std::chrono::milliseconds min_window, const std::chrono::milliseconds max_window,
                           const std::chrono::milliseconds base_latency)
    : min_(min_window),
      max_(std::max(min_window, max_window)),
      ema_ms_(static_cast<float>(base_latency.count())) {}

void GatherWindow::observe(const std::chrono::milliseconds latency) noexcept {
  const float sample = static_cast<float>(std::max<std::chrono::milliseconds::rep>(latency.count(), 0));
  ema_ms_ = ((1.0F - kAlpha) * ema_ms_) + (kAlpha * sample);
}

std::chrono::milliseconds GatherWindow::window() const noexcept {
  const auto scaled = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::lround(kHeadroom * ema_ms_)));
  return std::clamp(scaled, min_, max_);
}

}  // namespace turnwise::coordination
