#pragma once

#include "model/agent_snapshot.hpp"

namespace turnwise::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::AgentSnapshot& snapshot) const;
};

}  // namespace turnwise::sinks
