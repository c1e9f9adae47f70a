#include "ingest/jsonl_reader.hpp"

#include <istream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "core/log.hpp"
#include "core/math.hpp"

namespace turnwise::ingest {
namespace {

std::string required_string(const nlohmann::json& object, const char* field) {
  const auto it = object.find(field);
  if (it == object.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument(std::string(field) + " must be a non-empty string");
  }
  return it->get<std::string>();
}

float parse_priority(const nlohmann::json& value, const std::string& field) {
  if (!value.is_number()) {
    throw std::invalid_argument(field + " must be a number");
  }
  return core::clamp01(static_cast<float>(value.get<double>()));
}

}  // namespace

IngestRecord parse_ingest_line(const std::string& line, const model::Clock::time_point now) {
  nlohmann::json object;
  try {
    object = nlohmann::json::parse(line);
  } catch (const nlohmann::json::exception& ex) {
    // parse_error for bad syntax, out_of_range for numbers past double range.
    throw std::invalid_argument(std::string("invalid JSON: ") + ex.what());
  }
  if (!object.is_object()) {
    throw std::invalid_argument("event must be a JSON object");
  }

  IngestRecord record{};
  record.event.id = required_string(object, "id");
  record.event.context_id = required_string(object, "context");
  record.event.timestamp = now;

  if (const auto it = object.find("payload"); it != object.end()) {
    if (!it->is_string()) {
      throw std::invalid_argument("payload must be a string");
    }
    record.event.payload = it->get<std::string>();
  }

  const auto priorities_it = object.find("priorities");
  if (priorities_it != object.end()) {
    if (!priorities_it->is_object() || priorities_it->empty()) {
      throw std::invalid_argument("priorities must be a non-empty object");
    }
    for (const auto& [agent_id, value] : priorities_it->items()) {
      record.priorities[agent_id] = parse_priority(value, "priorities." + agent_id);
    }
    return record;
  }

  const auto priority_it = object.find("priority");
  if (priority_it == object.end()) {
    throw std::invalid_argument("either priority or priorities is required");
  }
  record.event.priority = parse_priority(*priority_it, "priority");
  return record;
}

std::size_t route_record(core::Runtime& runtime, const IngestRecord& record) {
  if (record.priorities.empty()) {
    return runtime.broadcast(record.event);
  }

  std::size_t delivered = 0;
  for (const auto& [agent_id, priority] : record.priorities) {
    model::Event copy = record.event;
    copy.priority = priority;
    if (runtime.deliver(agent_id, std::move(copy))) {
      ++delivered;
    }
  }
  return delivered;
}

IngestStats ingest_stream(std::istream& in, core::Runtime& runtime) {
  IngestStats stats{};
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    ++stats.lines;
    try {
      stats.deliveries += route_record(runtime, parse_ingest_line(line));
    } catch (const std::invalid_argument& ex) {
      ++stats.malformed;
      core::log(core::log_level::WARN, "ingest", "skipping line ", stats.lines, ": ", ex.what());
    }
  }
  return stats;
}

}  // namespace turnwise::ingest
