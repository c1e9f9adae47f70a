#pragma once

#include <chrono>
#include <cstddef>

#include "core/config.hpp"
#include "model/agent_snapshot.hpp"
#include "model/event.hpp"

namespace turnwise::state {

// Energy/attention model of one agent. Mutated only by the owning agent's
// loop thread; other threads observe it through snapshots.
class AgentState {
 public:
  explicit AgentState(core::CadenceTable cadence = {}, float compute_budget = 1.0F);

  // Throws std::invalid_argument for a non-finite complexity.
  void record_activity(std::chrono::milliseconds duration, float complexity = 1.0F,
                       model::Clock::time_point now = model::Clock::now());
  void rest(std::chrono::milliseconds duration);
  void update_inbox_load(std::size_t depth);
  void update_compute_budget(float budget);

  [[nodiscard]] bool should_engage(const model::Event& event) const noexcept;
  [[nodiscard]] std::chrono::milliseconds cadence() const noexcept;
  [[nodiscard]] model::mood current_mood() const noexcept { return state_.current_mood; }
  [[nodiscard]] const model::AgentStateSnapshot& snapshot() const noexcept { return state_; }

  [[nodiscard]] static float engagement_threshold(model::mood value) noexcept;

 private:
  void recompute_mood();

  core::CadenceTable cadence_;
  model::AgentStateSnapshot state_{};
};

}  // namespace turnwise::state
