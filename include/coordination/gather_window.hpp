#pragma once

#include <chrono>

namespace turnwise::coordination {

// Adaptive gathering interval: an EWMA of observed intent-arrival latency,
// scaled by a headroom factor and clamped to [min, max].
class GatherWindow {
 public:
  GatherWindow(std::chrono::milliseconds min_window, std::chrono::milliseconds max_window,
               std::chrono::milliseconds base_latency);

  void observe(std::chrono::milliseconds latency) noexcept;

  [[nodiscard]] std::chrono::milliseconds window() const noexcept;
  [[nodiscard]] float latency_ema_ms() const noexcept { return ema_ms_; }

 private:
  static constexpr float kAlpha = 0.30F;
  static constexpr float kHeadroom = 1.5F;

  std::chrono::milliseconds min_;
  std::chrono::milliseconds max_;
  float ema_ms_{0.0F};
};

}  // namespace turnwise::coordination
