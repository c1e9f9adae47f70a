#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace turnwise::model {

enum class mood : std::uint8_t {
  IDLE = 0,
  ACTIVE = 1,
  TIRED = 2,
  OVERWHELMED = 3,
};

inline const char* mood_name(const mood value) noexcept {
  switch (value) {
    case mood::IDLE:
      return "idle";
    case mood::ACTIVE:
      return "active";
    case mood::TIRED:
      return "tired";
    case mood::OVERWHELMED:
      return "overwhelmed";
  }
  return "unknown";
}

struct AgentStateSnapshot {
  float energy{1.0F};
  float attention{1.0F};
  mood current_mood{mood::IDLE};
  std::size_t inbox_load{0};
  std::chrono::steady_clock::time_point last_activity{};
  std::uint64_t response_count{0};
  float compute_budget{1.0F};
};

struct RateLimitInfo {
  std::string context_id;
  std::chrono::steady_clock::time_point last_response{};
  std::uint32_t response_count{0};
  bool limited{false};
};

struct AgentStats {
  std::uint64_t cycles{0};
  std::uint64_t engagements{0};
  std::uint64_t turns_granted{0};
  std::uint64_t turns_denied{0};
  std::uint64_t actions_succeeded{0};
  std::uint64_t actions_failed{0};
  std::uint64_t rate_limited_skips{0};
  std::uint64_t loop_faults{0};
};

struct AgentSnapshot {
  std::string agent_id;
  AgentStateSnapshot state{};
  std::vector<RateLimitInfo> rate_limits{};
  std::size_t inbox_depth{0};
  AgentStats stats{};
};

}  // namespace turnwise::model
