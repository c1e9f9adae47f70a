#include "sinks/redis_ts.hpp"

#include "core/log.hpp"
#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace turnwise::sinks {
namespace {

double sanitize_value(const float value) {
  return std::isfinite(value) ? static_cast<double>(value) : 0.0;
}

void add_series_args(std::vector<std::string>& args, const std::string& key_prefix, const std::string& agent_id,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + agent_id + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

}  // namespace

const std::vector<std::string>& agent_series_suffixes() {
  static const std::vector<std::string> kSeriesSuffixes = {
      "state:energy",
      "state:attention",
      "state:mood",
      "state:inbox_load",
      "state:compute_budget",
      "state:response_count",
      "agent:turns_granted",
      "agent:turns_denied",
      "agent:actions_failed",
  };
  return kSeriesSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();
  schema_ready_.clear();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      core::log(core::log_level::WARN, "redis", "connect failed: ", raw->errstr);
      redisFree(raw);
    } else {
      core::log(core::log_level::WARN, "redis", "connect failed: out of memory");
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    core::log(core::log_level::WARN, "redis", "AUTH rejected");
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema(const std::string& agent_id) {
  if (schema_ready_.count(agent_id) != 0) {
    return true;
  }

  for (const auto& suffix : agent_series_suffixes()) {
    const std::string key = options_.key_prefix + ":" + agent_id + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST LABELS agent %s", key.c_str(),
                     agent_id.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      core::log(core::log_level::WARN, "redis", "RedisTimeSeries module not available (TS.CREATE unknown command)");
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      core::log(core::log_level::WARN, "redis", "schema error on TS.CREATE ", key, ": ", reply_message);
      return false;
    }
  }

  schema_ready_.insert(agent_id);
  return true;
}

bool RedisTsSink::publish(const std::vector<model::AgentSnapshot>& snapshots) {
  if (snapshots.empty()) {
    return true;
  }
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(snapshots)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(snapshots);
}

bool RedisTsSink::publish_impl(const std::vector<model::AgentSnapshot>& snapshots) {
  for (const auto& snapshot : snapshots) {
    if (!ensure_schema(snapshot.agent_id)) {
      return false;
    }
  }

  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ms();

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  for (const auto& snapshot : snapshots) {
    const auto append = [&](const char* suffix, const double value) {
      add_series_args(command_args_, options_.key_prefix, snapshot.agent_id, timestamp_ms, suffix, value);
    };
    append("state:energy", sanitize_value(snapshot.state.energy));
    append("state:attention", sanitize_value(snapshot.state.attention));
    append("state:mood", static_cast<double>(static_cast<std::uint8_t>(snapshot.state.current_mood)));
    append("state:inbox_load", static_cast<double>(snapshot.inbox_depth));
    append("state:compute_budget", sanitize_value(snapshot.state.compute_budget));
    append("state:response_count", static_cast<double>(snapshot.state.response_count));
    append("agent:turns_granted", static_cast<double>(snapshot.stats.turns_granted));
    append("agent:turns_denied", static_cast<double>(snapshot.stats.turns_denied));
    append("agent:actions_failed", static_cast<double>(snapshot.stats.actions_failed));
  }

  command_argv_.reserve(command_args_.size());
  command_argv_len_.reserve(command_args_.size());
  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto publish_start = std::chrono::steady_clock::now();
  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  last_latency_ms_ = core::to_millis(std::chrono::steady_clock::now() - publish_start);
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace turnwise::sinks
