#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace turnwise::sinks {

void StdoutDebugSink::publish(const model::AgentSnapshot& snapshot) const {
  std::printf("[state] %s mood=%s energy=%.2f attention=%.2f inbox=%zu responses=%llu granted=%llu denied=%llu failed=%llu\n",
              snapshot.agent_id.c_str(), model::mood_name(snapshot.state.current_mood), snapshot.state.energy,
              snapshot.state.attention, snapshot.inbox_depth,
              static_cast<unsigned long long>(snapshot.state.response_count),
              static_cast<unsigned long long>(snapshot.stats.turns_granted),
              static_cast<unsigned long long>(snapshot.stats.turns_denied),
              static_cast<unsigned long long>(snapshot.stats.actions_failed));
  std::fflush(stdout);
}

}  // namespace turnwise::sinks
