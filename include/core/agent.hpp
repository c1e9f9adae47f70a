#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "coordination/turn_coordinator.hpp"
#include "core/action_executor.hpp"
#include "core/config.hpp"
#include "inbox/event_inbox.hpp"
#include "model/agent_snapshot.hpp"
#include "model/event.hpp"
#include "state/agent_state.hpp"
#include "state/rate_limiter.hpp"

namespace turnwise::core {

// One autonomous persona: its inbox, state model and rate limiter, plus the
// scheduling loop that rests, evaluates, asks for a turn and acts.
class Agent {
 public:
  Agent(AgentConfig config, coordination::TurnCoordinator& coordinator, ActionExecutor& executor);

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  inbox::enqueue_result deliver(model::Event event);

  void run_cycle(std::stop_token stop = {});
  void run(std::stop_token stop);

  // Applied by the loop thread at the start of its next cycle.
  void set_compute_budget(float budget);
  void reset_context(const std::string& context_id);
  void reset_all_contexts();

  [[nodiscard]] model::AgentSnapshot snapshot() const;
  [[nodiscard]] const std::string& id() const noexcept { return config_.id; }

  // Rejects further deliveries; used on shutdown.
  void close_inbox() { inbox_.close(); }

 private:
  std::chrono::milliseconds rest(std::chrono::milliseconds duration, std::stop_token stop);
  void apply_pending_requests();
  void engage(const model::InboxEntry& entry, std::stop_token stop);
  void dispatch(const model::Event& event);
  void publish_snapshot();

  const AgentConfig config_;
  coordination::TurnCoordinator& coordinator_;
  ActionExecutor& executor_;
  inbox::EventInbox inbox_;
  state::AgentState state_;
  state::RateLimiter rate_limiter_;
  model::AgentStats stats_{};

  std::mutex rest_mutex_;
  std::condition_variable_any rest_cv_;

  std::mutex requests_mutex_;
  std::optional<float> pending_compute_budget_{};
  std::vector<std::string> pending_resets_{};
  bool pending_reset_all_{false};

  mutable std::mutex snapshot_mutex_;
  model::AgentSnapshot published_{};
};

}  // namespace turnwise::core
