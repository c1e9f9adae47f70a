#include "mcp/tools.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>

namespace turnwise::mcp {

namespace {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"turnwise"};
  std::uint32_t connect_timeout_ms{1000};
};

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

class RedisConnection {
 public:
  explicit RedisConnection(RedisConfig config) : config_(std::move(config)) {}

  void connect() {
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(config_.connect_timeout_ms / 1000U);
    timeout.tv_usec = static_cast<suseconds_t>((config_.connect_timeout_ms % 1000U) * 1000U);

    redisContext* raw = nullptr;
    if (!config_.unix_socket.empty()) {
      raw = redisConnectUnixWithTimeout(config_.unix_socket.c_str(), timeout);
    } else {
      raw = redisConnectWithTimeout(config_.host.c_str(), static_cast<int>(config_.port), timeout);
    }

    if (raw == nullptr) {
      throw std::runtime_error("redis connection failed: out of memory");
    }
    context_.reset(raw);

    if (context_->err != REDIS_OK) {
      throw std::runtime_error(std::string("redis connection failed: ") + context_->errstr);
    }

    if (!config_.password.empty()) {
      auto auth_reply = command("AUTH %s", config_.password.c_str());
      if (auth_reply->type == REDIS_REPLY_ERROR) {
        throw std::runtime_error("redis AUTH failed");
      }
    }

    if (config_.db != 0) {
      auto db_reply = command("SELECT %d", config_.db);
      if (db_reply->type == REDIS_REPLY_ERROR) {
        throw std::runtime_error("redis SELECT failed");
      }
    }
  }

  RedisReplyPtr command(const char* format, ...) {
    va_list ap;
    va_start(ap, format);
    auto* raw = static_cast<redisReply*>(redisvCommand(context_.get(), format, ap));
    va_end(ap);

    if (raw == nullptr) {
      throw std::runtime_error("redis command failed");
    }
    return RedisReplyPtr(raw);
  }

  const RedisConfig& config() const { return config_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const {
      if (context != nullptr) {
        redisFree(context);
      }
    }
  };

  RedisConfig config_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

int getenv_or_int(const char* name, const int fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::stoi(value);
  }
  return fallback;
}

RedisConfig load_redis_config() {
  RedisConfig config;
  config.host = getenv_or("TURNWISE_REDIS_HOST", config.host);
  config.port = static_cast<std::uint16_t>(getenv_or_int("TURNWISE_REDIS_PORT", static_cast<int>(config.port)));
  config.unix_socket = getenv_or("TURNWISE_REDIS_UNIX_SOCKET", config.unix_socket);
  config.password = getenv_or("TURNWISE_REDIS_PASSWORD", config.password);
  config.db = getenv_or_int("TURNWISE_REDIS_DB", config.db);
  config.key_prefix = getenv_or("TURNWISE_REDIS_PREFIX", config.key_prefix);
  config.connect_timeout_ms =
      static_cast<std::uint32_t>(getenv_or_int("TURNWISE_REDIS_CONNECT_TIMEOUT_MS", config.connect_timeout_ms));
  return config;
}

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string required_agent(const nlohmann::json& params) {
  const auto agent_it = params.find("agent");
  if (agent_it == params.end() || !agent_it->is_string() || agent_it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument("agent must be a non-empty string");
  }
  const auto agent = agent_it->get<std::string>();
  if (agent.find_first_of(":*?[]") != std::string::npos) {
    throw std::invalid_argument("agent must not contain ':' or glob characters");
  }
  return agent;
}

std::vector<std::string> scan_keys(RedisConnection& redis, const std::string& pattern) {
  auto reply = redis.command("KEYS %s", pattern.c_str());
  if (reply->type == REDIS_REPLY_ERROR) {
    throw std::runtime_error("failed to list series keys");
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    throw std::runtime_error("unexpected response from KEYS");
  }

  std::vector<std::string> keys;
  keys.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const auto* element = reply->element[i];
    if (element != nullptr && element->type == REDIS_REPLY_STRING && element->str != nullptr) {
      keys.emplace_back(element->str, static_cast<std::size_t>(element->len));
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

double parse_sample_value(const redisReply* value) {
  if (value == nullptr) {
    return 0.0;
  }
  if (value->type == REDIS_REPLY_DOUBLE || value->type == REDIS_REPLY_STRING || value->type == REDIS_REPLY_STATUS) {
    return value->str != nullptr ? std::stod(value->str) : 0.0;
  }
  if (value->type == REDIS_REPLY_INTEGER) {
    return static_cast<double>(value->integer);
  }
  return 0.0;
}

std::int64_t parse_sample_timestamp(const redisReply* timestamp) {
  if (timestamp == nullptr) {
    return 0;
  }
  if (timestamp->type == REDIS_REPLY_INTEGER) {
    return static_cast<std::int64_t>(timestamp->integer);
  }
  return timestamp->str != nullptr ? std::stoll(timestamp->str) : 0;
}

nlohmann::json handle_agents_list(const nlohmann::json& /*params*/) {
  RedisConnection redis(load_redis_config());
  redis.connect();

  const auto& prefix = redis.config().key_prefix;
  std::set<std::string> agents;
  for (const auto& key : scan_keys(redis, prefix + ":*:state:energy")) {
    std::string agent_id;
    std::string suffix;
    if (split_series_key(key, prefix, agent_id, suffix)) {
      agents.insert(agent_id);
    }
  }

  return nlohmann::json{{"tool", "agents.list"}, {"prefix", prefix}, {"agents", agents}};
}

nlohmann::json handle_agents_state(const nlohmann::json& params) {
  const auto agent = required_agent(params);

  RedisConnection redis(load_redis_config());
  redis.connect();

  const auto& prefix = redis.config().key_prefix;
  const auto keys = scan_keys(redis, prefix + ":" + agent + ":*");
  if (keys.empty()) {
    throw std::invalid_argument("no series published for agent " + agent);
  }

  nlohmann::json latest = nlohmann::json::object();
  std::int64_t newest_ms = 0;
  for (const auto& key : keys) {
    std::string agent_id;
    std::string suffix;
    if (!split_series_key(key, prefix, agent_id, suffix)) {
      continue;
    }

    auto reply = redis.command("TS.GET %s", key.c_str());
    if (reply->type == REDIS_REPLY_ERROR) {
      throw std::runtime_error("TS.GET failed for key " + key);
    }
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
      continue;
    }

    const auto timestamp = parse_sample_timestamp(reply->element[0]);
    newest_ms = std::max(newest_ms, timestamp);
    latest[suffix] = parse_sample_value(reply->element[1]);
  }

  return nlohmann::json{{"tool", "agents.state"},
                        {"agent", agent},
                        {"timestamp", newest_ms},
                        {"age_ms", newest_ms > 0 ? now_ms() - newest_ms : 0},
                        {"series", latest}};
}

nlohmann::json handle_agents_history(const nlohmann::json& params) {
  const auto agent = required_agent(params);

  const auto window_it = params.find("window");
  if (window_it == params.end() || !window_it->is_string()) {
    throw std::invalid_argument("window must be a string");
  }
  const auto window_ms = parse_window_ms(window_it->get<std::string>());
  const auto to_ms = now_ms();
  const auto from_ms = to_ms - window_ms;

  RedisConnection redis(load_redis_config());
  redis.connect();

  const auto& prefix = redis.config().key_prefix;
  nlohmann::json series = nlohmann::json::array();
  std::size_t total_samples = 0;

  for (const auto& key : scan_keys(redis, prefix + ":" + agent + ":*")) {
    std::string agent_id;
    std::string suffix;
    if (!split_series_key(key, prefix, agent_id, suffix)) {
      continue;
    }

    auto reply = redis.command("TS.RANGE %s %lld %lld", key.c_str(), static_cast<long long>(from_ms),
                               static_cast<long long>(to_ms));
    if (reply->type == REDIS_REPLY_ERROR) {
      throw std::runtime_error("TS.RANGE failed for key " + key);
    }
    if (reply->type != REDIS_REPLY_ARRAY) {
      throw std::runtime_error("unexpected TS.RANGE response for key " + key);
    }

    double sum = 0.0;
    double min_value = 0.0;
    double max_value = 0.0;
    nlohmann::json points = nlohmann::json::array();
    for (std::size_t i = 0; i < reply->elements; ++i) {
      const auto* point = reply->element[i];
      if (point == nullptr || point->type != REDIS_REPLY_ARRAY || point->elements != 2) {
        continue;
      }
      const auto timestamp = parse_sample_timestamp(point->element[0]);
      const auto value = parse_sample_value(point->element[1]);
      if (points.empty()) {
        min_value = value;
        max_value = value;
      } else {
        min_value = std::min(min_value, value);
        max_value = std::max(max_value, value);
      }
      points.push_back({{"timestamp", timestamp}, {"value", value}});
      sum += value;
    }

    const auto count = points.size();
    total_samples += count;
    series.push_back({{"series", suffix},
                      {"sample_count", count},
                      {"avg", count > 0 ? sum / static_cast<double>(count) : 0.0},
                      {"min", min_value},
                      {"max", max_value},
                      {"points", points}});
  }

  return nlohmann::json{{"tool", "agents.history"},
                        {"agent", agent},
                        {"window", *window_it},
                        {"from", from_ms},
                        {"to", to_ms},
                        {"summary", {{"series_count", series.size()}, {"sample_count", total_samples}}},
                        {"series", series}};
}

nlohmann::json agent_only_schema() {
  return nlohmann::json{{"type", "object"},
                        {"properties", {{"agent", {{"type", "string"}}}}},
                        {"required", {"agent"}},
                        {"additionalProperties", false}};
}

}  // namespace

std::int64_t parse_window_ms(const std::string& window) {
  if (window.empty()) {
    throw std::invalid_argument("window must not be empty");
  }

  std::size_t suffix_pos = window.size();
  while (suffix_pos > 0 && std::isalpha(static_cast<unsigned char>(window[suffix_pos - 1])) != 0) {
    --suffix_pos;
  }

  if (suffix_pos == 0) {
    throw std::invalid_argument("window must start with a numeric value");
  }

  std::size_t consumed = 0;
  const auto digits = window.substr(0, suffix_pos);
  const auto value = std::stoll(digits, &consumed);
  if (consumed != digits.size() || value <= 0) {
    throw std::invalid_argument("window must be a positive integer with an optional unit");
  }
  const auto suffix = window.substr(suffix_pos);

  if (suffix == "ms" || suffix.empty()) {
    return value;
  }
  if (suffix == "s") {
    return value * 1000;
  }
  if (suffix == "m") {
    return value * 60 * 1000;
  }
  if (suffix == "h") {
    return value * 60 * 60 * 1000;
  }

  throw std::invalid_argument("unsupported window suffix; use ms, s, m, or h");
}

bool split_series_key(const std::string& key, const std::string& prefix, std::string& agent_id, std::string& suffix) {
  if (key.size() <= prefix.size() + 1 || key.compare(0, prefix.size(), prefix) != 0 || key[prefix.size()] != ':') {
    return false;
  }
  const auto rest = key.substr(prefix.size() + 1);
  const auto split = rest.find(':');
  if (split == std::string::npos || split == 0 || split + 1 >= rest.size()) {
    return false;
  }
  agent_id = rest.substr(0, split);
  suffix = rest.substr(split + 1);
  return true;
}

ToolRegistry build_tool_registry() {
  ToolRegistry registry;

  Tool agents_list{.name = "agents.list",
                   .description = "List agents that have published state series.",
                   .input_schema = nlohmann::json{{"type", "object"},
                                                  {"properties", nlohmann::json::object()},
                                                  {"additionalProperties", false}},
                   .handler = handle_agents_list};

  Tool agents_state{.name = "agents.state",
                    .description = "Latest energy, attention, mood, inbox load and turn counters of one agent.",
                    .input_schema = agent_only_schema(),
                    .handler = handle_agents_state};

  Tool agents_history{.name = "agents.history",
                      .description = "Per-series points, average and range of one agent over a window.",
                      .input_schema =
                          nlohmann::json{{"type", "object"},
                                         {"properties", {{"agent", {{"type", "string"}}}, {"window", {{"type", "string"}}}}},
                                         {"required", {"agent", "window"}},
                                         {"additionalProperties", false}},
                      .handler = handle_agents_history};

  registry.emplace(agents_list.name, std::move(agents_list));
  registry.emplace(agents_state.name, std::move(agents_state));
  registry.emplace(agents_history.name, std::move(agents_history));
  return registry;
}

}  // namespace turnwise::mcp
