#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "coordination/gather_window.hpp"
#include "core/config.hpp"
#include "model/event.hpp"

namespace turnwise::coordination {

enum class phase : std::uint8_t {
  GATHERING = 0,
  DECIDING = 1,
  DECIDED = 2,
};

enum class rejection_reason : std::uint8_t {
  OUTRANKED = 0,
  LOW_CONFIDENCE = 1,
  LATE = 2,
  WITHDRAWN = 3,
};

inline constexpr std::size_t kRejectionReasonCount = 4;

const char* phase_name(phase value) noexcept;
const char* rejection_reason_name(rejection_reason value) noexcept;

struct Intent {
  std::string agent_id;
  float confidence{0.0F};
  model::Clock::time_point timestamp{};
  std::uint64_t order{0};
};

struct Rejection {
  std::string agent_id;
  rejection_reason reason{rejection_reason::OUTRANKED};
  float confidence{0.0F};
};

struct Decision {
  std::string trigger_id;
  std::string context_id;
  std::vector<std::string> granted;
  std::vector<std::string> denied;
  std::vector<Rejection> rejections;
  // Agents that declined before the decision; neither granted nor denied.
  std::vector<std::string> deferred;
  std::string reasoning;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool is_granted(const std::string& agent_id) const;
};

struct CoordinatorStats {
  std::size_t active_contexts{0};
  std::uint64_t total_decisions{0};
  std::uint64_t total_grants{0};
  std::array<std::uint64_t, kRejectionReasonCount> rejections{};
  std::chrono::milliseconds gather_window{0};
};

// Arbitrates which agents may act on a trigger. Each trigger owns its own
// lock; distinct triggers never contend beyond the short registry lookup.
class TurnCoordinator {
 public:
  using Clock = model::Clock;

  explicit TurnCoordinator(core::CoordinatorConfig config = {});
  ~TurnCoordinator();

  TurnCoordinator(const TurnCoordinator&) = delete;
  TurnCoordinator& operator=(const TurnCoordinator&) = delete;

  // context_id keys recency tracking; an empty value falls back to trigger_id.
  void register_intent(const std::string& trigger_id, const std::string& agent_id, float confidence,
                       const std::string& context_id = {});

  bool request_turn(const std::string& agent_id, const std::string& trigger_id, float confidence,
                    std::chrono::milliseconds timeout, std::stop_token stop = {}, const std::string& context_id = {});

  // Records that agent_id will not claim trigger_id. Only applies to a
  // trigger that is still gathering; never opens a new round.
  void register_deferral(const std::string& trigger_id, const std::string& agent_id);

  [[nodiscard]] std::optional<Decision> decision(const std::string& trigger_id) const;
  [[nodiscard]] std::optional<phase> phase_of(const std::string& trigger_id) const;

  // Decides expired gathering contexts and erases decided contexts past
  // retention. An erased trigger keeps denying late requests for one more
  // retention period. Returns the number of erased contexts.
  std::size_t sweep(Clock::time_point now = Clock::now());

  void observe_latency(std::chrono::milliseconds latency);
  [[nodiscard]] std::chrono::milliseconds gather_window() const;
  [[nodiscard]] CoordinatorStats stats() const;
  [[nodiscard]] const core::CoordinatorConfig& config() const noexcept { return config_; }

  void shutdown();

 private:
  struct CoordinationContext {
    std::mutex mutex;
    std::condition_variable_any decided;
    std::string trigger_id;
    std::string context_id;
    phase current{phase::GATHERING};
    std::vector<Intent> intents;
    std::vector<Intent> withdrawn;
    std::vector<std::string> deferred;
    std::shared_ptr<const Decision> decision;
    Clock::time_point created{};
    Clock::time_point gather_deadline{};
    Clock::time_point last_intent{};
    Clock::time_point decided_at{};
    std::uint64_t next_order{0};
  };

  // Returns nullptr for a recently retired trigger.
  std::shared_ptr<CoordinationContext> acquire_context(const std::string& trigger_id, const std::string& context_id,
                                                       Clock::time_point now);
  [[nodiscard]] std::shared_ptr<CoordinationContext> find_context(const std::string& trigger_id) const;

  void add_intent_locked(CoordinationContext& context, const std::string& agent_id, float confidence,
                         Clock::time_point now);
  void withdraw_locked(CoordinationContext& context, const std::string& agent_id);
  [[nodiscard]] bool early_exit_ready_locked(const CoordinationContext& context) const;
  void decide_locked(CoordinationContext& context, Clock::time_point now);
  bool finish_locked(CoordinationContext& context, const std::string& agent_id);

  [[nodiscard]] float recency_penalty(const std::string& context_id, const std::string& agent_id) const;
  void track_grants(const std::string& context_id, const std::vector<std::string>& granted);
  void count_rejection(rejection_reason reason);

  const core::CoordinatorConfig config_;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<CoordinationContext>> contexts_;
  std::unordered_map<std::string, Clock::time_point> retired_;

  mutable std::mutex recency_mutex_;
  std::unordered_map<std::string, std::deque<std::string>> recent_responders_;

  mutable std::mutex window_mutex_;
  GatherWindow window_;

  mutable std::mutex stats_mutex_;
  CoordinatorStats stats_{};

  std::atomic<bool> shutdown_{false};
};

}  // namespace turnwise::coordination
