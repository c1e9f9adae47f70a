#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/config.hpp"
#include "model/agent_snapshot.hpp"
#include "model/event.hpp"

namespace turnwise::state {

// Per-agent, per-context response throttle. Owned by one agent; not shared.
class RateLimiter {
 public:
  using Clock = model::Clock;

  explicit RateLimiter(core::RateLimitConfig config = {});

  [[nodiscard]] bool is_rate_limited(const std::string& context_id, Clock::time_point now = Clock::now()) const;
  void record_response(const std::string& context_id, Clock::time_point now = Clock::now());
  void reset(const std::string& context_id);
  void reset_all();

  [[nodiscard]] model::RateLimitInfo rate_limit_info(const std::string& context_id,
                                                     Clock::time_point now = Clock::now()) const;
  [[nodiscard]] std::vector<model::RateLimitInfo> all_rate_limit_info(Clock::time_point now = Clock::now()) const;
  [[nodiscard]] const core::RateLimitConfig& config() const noexcept { return config_; }

 private:
  const core::RateLimitConfig config_;
  std::unordered_map<std::string, Clock::time_point> last_response_time_;
  std::unordered_map<std::string, std::uint32_t> response_count_;
};

}  // namespace turnwise::state
