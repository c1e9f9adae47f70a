#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "coordination/turn_coordinator.hpp"
#include "core/action_executor.hpp"
#include "core/agent.hpp"
#include "core/config.hpp"
#include "model/agent_snapshot.hpp"
#include "model/event.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace turnwise::core {

// Hosts every agent on its own thread around one shared TurnCoordinator, and
// runs housekeeping (coordinator sweep, snapshot publishing) on another.
class Runtime {
 public:
  Runtime(RuntimeConfig config, ActionExecutor& executor);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  void start();
  void stop();

  bool deliver(const std::string& agent_id, model::Event event);
  std::size_t broadcast(const model::Event& event);

  void housekeeping_once();

  // Queued for the agent's own loop thread; false for an unknown agent.
  bool set_compute_budget(const std::string& agent_id, float budget);
  bool reset_context(const std::string& agent_id, const std::string& context_id);
  bool reset_all_contexts(const std::string& agent_id);

  [[nodiscard]] std::vector<model::AgentSnapshot> inspect() const;
  [[nodiscard]] coordination::CoordinatorStats coordinator_stats() const { return coordinator_.stats(); }
  [[nodiscard]] const Agent* find_agent(const std::string& agent_id) const;
  [[nodiscard]] std::vector<std::string> agent_ids() const;

 private:
  void housekeeping_loop(std::stop_token stop);
  void publish_sinks(const std::vector<model::AgentSnapshot>& snapshots);
  Agent* agent_by_id(const std::string& agent_id);

  const RuntimeConfig config_;
  coordination::TurnCoordinator coordinator_;
  std::vector<std::unique_ptr<Agent>> agents_;
  std::unordered_map<std::string, Agent*> agents_by_id_;

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};

  std::mutex housekeeping_mutex_;
  std::condition_variable_any housekeeping_cv_;
  std::vector<std::jthread> agent_threads_;
  std::jthread housekeeping_thread_;
  bool started_{false};
  bool stopped_{false};
};

}  // namespace turnwise::core
