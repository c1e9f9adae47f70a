#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace turnwise::model {

using Clock = std::chrono::steady_clock;

// Priority is supplied by the ingestion side, already normalized to [0,1].
struct Event {
  std::string id;
  std::string context_id;
  std::string payload;
  Clock::time_point timestamp{};
  float priority{0.0F};
};

struct InboxEntry {
  Event event;
  Clock::time_point arrival{};
  std::uint64_t sequence{0};
};

}  // namespace turnwise::model
