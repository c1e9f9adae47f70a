#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace turnwise::mcp {

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

ToolRegistry build_tool_registry();

// "30s", "5m", "250ms", "1h"; a bare number is milliseconds.
std::int64_t parse_window_ms(const std::string& window);

// Splits "<prefix>:<agent>:<group>:<name>" into agent id and series suffix.
bool split_series_key(const std::string& key, const std::string& prefix, std::string& agent_id, std::string& suffix);

}  // namespace turnwise::mcp
