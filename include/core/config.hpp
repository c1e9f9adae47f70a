#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace turnwise::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  bool enabled{false};
};

struct RateLimitConfig {
  std::chrono::seconds min_between_responses{10};
  std::uint32_t max_responses_per_session{50};
};

struct InboxConfig {
  std::size_t capacity{1000};
  std::chrono::seconds max_age{300};
};

struct CadenceTable {
  std::chrono::milliseconds overwhelmed{10000};
  std::chrono::milliseconds tired{7000};
  std::chrono::milliseconds active{5000};
  std::chrono::milliseconds idle{3000};
};

struct CoordinatorConfig {
  std::size_t max_responders{1};
  std::chrono::milliseconds gather_min{2000};
  std::chrono::milliseconds gather_max{20000};
  std::chrono::milliseconds gather_base{3000};
  float early_decision_confidence{0.9F};
  float min_confidence{0.3F};
  float recency_penalty{0.5F};
  std::size_t recent_responders{10};
  std::chrono::seconds retention{300};
  // Agents sharing the coordinator; 0 disables the all-answered early exit.
  // Filled in by Runtime, not read from the config file.
  std::size_t roster_size{0};
};

struct AgentConfig {
  std::string id{};
  RateLimitConfig rate_limit{};
  InboxConfig inbox{};
  CadenceTable cadence{};
  std::size_t peek_depth{5};
  std::chrono::milliseconds turn_timeout{25000};
  float compute_budget{1.0F};
};

struct AgentOverrides {
  std::optional<std::chrono::seconds> min_between_responses{};
  std::optional<std::uint32_t> max_responses_per_session{};
  std::optional<std::size_t> inbox_capacity{};
  std::optional<float> compute_budget{};
};

struct RuntimeConfig {
  std::vector<std::string> agent_ids{"helper"};
  RateLimitConfig rate_limit{};
  InboxConfig inbox{};
  CadenceTable cadence{};
  std::size_t peek_depth{5};
  std::chrono::milliseconds turn_timeout{25000};
  CoordinatorConfig coordinator{};
  std::unordered_map<std::string, AgentOverrides> overrides{};
  std::chrono::milliseconds publish_interval{1000};
  bool stdout_debug{true};
  bool debug_logging{false};
  RedisConfig redis{};
};

RuntimeConfig load_runtime_config(const std::string& path);

// Resolves the effective configuration of one agent, applying its overrides.
AgentConfig make_agent_config(const RuntimeConfig& config, const std::string& agent_id);

}  // namespace turnwise::core
