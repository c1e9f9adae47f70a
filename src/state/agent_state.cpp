#include "state/agent_state.hpp"

#include <cmath>
#include <stdexcept>

#include "core/log.hpp"
#include "core/math.hpp"

namespace turnwise::state {

namespace {

constexpr float kAlwaysEngagePriority = 0.8F;
constexpr float kTiredEnergyFloor = 0.2F;
constexpr std::size_t kOverwhelmedInboxLoad = 50;

float sanitize(const float value, const char* field) {
  if (!std::isfinite(value) || value < 0.0F || value > 1.0F) {
    core::log(core::log_level::WARN, "state", field, " out of range (", value, "); clamping");
    return std::isfinite(value) ? core::clamp01(value) : 0.0F;
  }
  return value;
}

}  // namespace

AgentState::AgentState(core::CadenceTable cadence, const float compute_budget) : cadence_(cadence) {
  state_.compute_budget = core::clamp01(compute_budget);
  recompute_mood();
}

void AgentState::record_activity(const std::chrono::milliseconds duration, const float complexity,
                                 const model::Clock::time_point now) {
  if (!std::isfinite(complexity)) {
    throw std::invalid_argument("activity complexity must be finite");
  }
  const float cost = (static_cast<float>(duration.count()) / 10000.0F) * (complexity < 0.0F ? 0.0F : complexity);
  state_.energy = core::clamp01(state_.energy - cost);
  if (state_.energy < 0.3F) {
    state_.attention = core::clamp01(state_.attention * 0.9F);
  }
  state_.last_activity = now;
  ++state_.response_count;
  recompute_mood();
}

void AgentState::rest(const std::chrono::milliseconds duration) {
  const float recovery = static_cast<float>(duration.count()) / 20000.0F;
  state_.energy = core::clamp01(state_.energy + recovery);
  state_.attention = core::clamp01(state_.attention + (2.0F * recovery));
  recompute_mood();
}

void AgentState::update_inbox_load(const std::size_t depth) {
  state_.inbox_load = depth;
  recompute_mood();
}

void AgentState::update_compute_budget(const float budget) { state_.compute_budget = sanitize(budget, "compute_budget"); }

float AgentState::engagement_threshold(const model::mood value) noexcept {
  switch (value) {
    case model::mood::OVERWHELMED:
      return 0.9F;
    case model::mood::TIRED:
      return 0.5F;
    case model::mood::ACTIVE:
      return 0.3F;
    case model::mood::IDLE:
      return 0.1F;
  }
  return 0.1F;
}

bool AgentState::should_engage(const model::Event& event) const noexcept {
  if (event.priority > kAlwaysEngagePriority) {
    return true;
  }

  const float threshold = engagement_threshold(state_.current_mood);
  if (state_.current_mood == model::mood::TIRED) {
    return event.priority > threshold && state_.energy > kTiredEnergyFloor;
  }
  return event.priority > threshold;
}

std::chrono::milliseconds AgentState::cadence() const noexcept {
  std::chrono::milliseconds base{};
  switch (state_.current_mood) {
    case model::mood::OVERWHELMED:
      base = cadence_.overwhelmed;
      break;
    case model::mood::TIRED:
      base = cadence_.tired;
      break;
    case model::mood::ACTIVE:
      base = cadence_.active;
      break;
    case model::mood::IDLE:
      base = cadence_.idle;
      break;
  }

  if (state_.compute_budget < 0.5F) {
    base *= 2;
  }
  return base;
}

void AgentState::recompute_mood() {
  state_.energy = sanitize(state_.energy, "energy");
  state_.attention = sanitize(state_.attention, "attention");

  if (state_.inbox_load > kOverwhelmedInboxLoad) {
    state_.current_mood = model::mood::OVERWHELMED;
  } else if (state_.energy < 0.3F) {
    state_.current_mood = model::mood::TIRED;
  } else if (state_.response_count > 0 && state_.energy > 0.5F) {
    state_.current_mood = model::mood::ACTIVE;
  } else {
    state_.current_mood = model::mood::IDLE;
  }
}

}  // namespace turnwise::state
