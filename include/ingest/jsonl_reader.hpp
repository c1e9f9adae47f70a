#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <unordered_map>

#include "core/runtime.hpp"
#include "model/event.hpp"

namespace turnwise::ingest {

struct IngestRecord {
  model::Event event;
  // Empty means broadcast to every agent with event.priority.
  std::unordered_map<std::string, float> priorities;
};

struct IngestStats {
  std::size_t lines{0};
  std::size_t malformed{0};
  std::size_t deliveries{0};
};

// Throws std::invalid_argument on malformed input.
IngestRecord parse_ingest_line(const std::string& line, model::Clock::time_point now = model::Clock::now());

std::size_t route_record(core::Runtime& runtime, const IngestRecord& record);

IngestStats ingest_stream(std::istream& in, core::Runtime& runtime);

}  // namespace turnwise::ingest
