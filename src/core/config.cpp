#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace turnwise::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value, const long long min_value,
                        const long long max_value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < min_value || parsed > max_value) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min_value) + ".." + std::to_string(max_value));
  }
  return parsed;
}

float parse_unit_float(const std::string& key, const std::string& value) {
  float parsed = 0.0F;
  try {
    parsed = std::stof(value);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number");
  }
  if (parsed < 0.0F || parsed > 1.0F) {
    throw std::runtime_error(key + " must be in range 0..1");
  }
  return parsed;
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  return std::chrono::milliseconds(parse_integer(key, value, 1, 3'600'000));
}

std::vector<std::string> parse_agent_ids(const std::string& value) {
  std::vector<std::string> ids;
  std::unordered_set<std::string> seen;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (item.empty()) {
      continue;
    }
    if (!seen.insert(item).second) {
      throw std::runtime_error("agents.names contains duplicate id: " + item);
    }
    ids.push_back(item);
  }
  if (ids.empty()) {
    throw std::runtime_error("agents.names must list at least one agent");
  }
  return ids;
}

void apply_agent_override(RuntimeConfig& config, const std::string& key, const std::string& value) {
  const auto remainder = key.substr(std::string("agents.").size());
  const auto split = remainder.find('.');
  if (split == std::string::npos) {
    throw std::runtime_error("unknown config key: " + key);
  }

  const std::string agent_id = remainder.substr(0, split);
  const std::string field = remainder.substr(split + 1);
  auto& overrides = config.overrides[agent_id];

  if (field == "min_seconds_between_responses") {
    overrides.min_between_responses = std::chrono::seconds(parse_integer(key, value, 0, 86'400));
    return;
  }
  if (field == "max_responses_per_session") {
    overrides.max_responses_per_session = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }
  if (field == "inbox_capacity") {
    overrides.inbox_capacity = static_cast<std::size_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }
  if (field == "compute_budget") {
    overrides.compute_budget = parse_unit_float(key, value);
    return;
  }

  throw std::runtime_error("unknown agent override: " + key);
}

void apply_key_value(RuntimeConfig& config, const std::string& key, const std::string& value) {
  if (key == "agents.names") {
    config.agent_ids = parse_agent_ids(value);
    return;
  }

  if (key.rfind("agents.", 0) == 0) {
    apply_agent_override(config, key, value);
    return;
  }

  if (key == "rate_limit.min_seconds_between_responses") {
    config.rate_limit.min_between_responses = std::chrono::seconds(parse_integer(key, value, 0, 86'400));
    return;
  }

  if (key == "rate_limit.max_responses_per_session") {
    config.rate_limit.max_responses_per_session = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }

  if (key == "inbox.capacity") {
    config.inbox.capacity = static_cast<std::size_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }

  if (key == "inbox.peek_depth") {
    config.peek_depth = static_cast<std::size_t>(parse_integer(key, value, 1, 1000));
    return;
  }

  if (key == "inbox.max_age_s") {
    config.inbox.max_age = std::chrono::seconds(parse_integer(key, value, 0, 86'400));
    return;
  }

  if (key == "cadence.overwhelmed_ms") {
    config.cadence.overwhelmed = parse_positive_ms(key, value);
    return;
  }
  if (key == "cadence.tired_ms") {
    config.cadence.tired = parse_positive_ms(key, value);
    return;
  }
  if (key == "cadence.active_ms") {
    config.cadence.active = parse_positive_ms(key, value);
    return;
  }
  if (key == "cadence.idle_ms") {
    config.cadence.idle = parse_positive_ms(key, value);
    return;
  }

  if (key == "coordinator.max_responders") {
    config.coordinator.max_responders = static_cast<std::size_t>(parse_integer(key, value, 1, 16));
    return;
  }
  if (key == "coordinator.gather_min_ms") {
    config.coordinator.gather_min = parse_positive_ms(key, value);
    return;
  }
  if (key == "coordinator.gather_max_ms") {
    config.coordinator.gather_max = parse_positive_ms(key, value);
    return;
  }
  if (key == "coordinator.gather_base_ms") {
    config.coordinator.gather_base = parse_positive_ms(key, value);
    return;
  }
  if (key == "coordinator.early_decision_confidence") {
    config.coordinator.early_decision_confidence = parse_unit_float(key, value);
    return;
  }
  if (key == "coordinator.min_confidence") {
    config.coordinator.min_confidence = parse_unit_float(key, value);
    return;
  }
  if (key == "coordinator.recency_penalty") {
    config.coordinator.recency_penalty = parse_unit_float(key, value);
    return;
  }
  if (key == "coordinator.recent_responders") {
    config.coordinator.recent_responders = static_cast<std::size_t>(parse_integer(key, value, 0, 1000));
    return;
  }
  if (key == "coordinator.retention_s") {
    config.coordinator.retention = std::chrono::seconds(parse_integer(key, value, 1, 86'400));
    return;
  }
  if (key == "coordinator.turn_timeout_ms") {
    config.turn_timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "agent.debug_logging") {
    config.debug_logging = parse_bool(value);
    return;
  }

  if (key == "agent.publish_interval_ms") {
    config.publish_interval = parse_positive_ms(key, value);
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = parse_integer("redis.address port", value.substr(split + 1), 1, 65535);
    config.redis.port = static_cast<std::uint16_t>(parsed_port);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

void validate(const RuntimeConfig& config) {
  if (config.coordinator.gather_max < config.coordinator.gather_min) {
    throw std::runtime_error("coordinator.gather_max_ms must be greater than or equal to coordinator.gather_min_ms");
  }
  if (config.turn_timeout < config.coordinator.gather_max) {
    throw std::runtime_error("coordinator.turn_timeout_ms must be greater than or equal to coordinator.gather_max_ms");
  }
  // A queued event must expire before its decision is forgotten.
  if (config.inbox.max_age.count() == 0 || config.inbox.max_age > config.coordinator.retention) {
    throw std::runtime_error("inbox.max_age_s must be between 1 and coordinator.retention_s");
  }
  for (const auto& [agent_id, _] : config.overrides) {
    if (std::find(config.agent_ids.begin(), config.agent_ids.end(), agent_id) == config.agent_ids.end()) {
      throw std::runtime_error("override for unknown agent: " + agent_id);
    }
  }
}

}  // namespace

RuntimeConfig load_runtime_config(const std::string& path) {
  RuntimeConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

AgentConfig make_agent_config(const RuntimeConfig& config, const std::string& agent_id) {
  AgentConfig agent{};
  agent.id = agent_id;
  agent.rate_limit = config.rate_limit;
  agent.inbox = config.inbox;
  agent.cadence = config.cadence;
  agent.peek_depth = config.peek_depth;
  agent.turn_timeout = config.turn_timeout;

  const auto it = config.overrides.find(agent_id);
  if (it == config.overrides.end()) {
    return agent;
  }

  const auto& overrides = it->second;
  if (overrides.min_between_responses.has_value()) {
    agent.rate_limit.min_between_responses = *overrides.min_between_responses;
  }
  if (overrides.max_responses_per_session.has_value()) {
    agent.rate_limit.max_responses_per_session = *overrides.max_responses_per_session;
  }
  if (overrides.inbox_capacity.has_value()) {
    agent.inbox.capacity = *overrides.inbox_capacity;
  }
  if (overrides.compute_budget.has_value()) {
    agent.compute_budget = *overrides.compute_budget;
  }
  return agent;
}

}  // namespace turnwise::core
