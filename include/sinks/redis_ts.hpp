#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "model/agent_snapshot.hpp"

struct redisContext;

namespace turnwise::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"turnwise"};
  std::uint32_t connect_timeout_ms{1000};
};

const std::vector<std::string>& agent_series_suffixes();

class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const std::vector<model::AgentSnapshot>& snapshots);

  [[nodiscard]] float last_latency_ms() const noexcept { return last_latency_ms_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema(const std::string& agent_id);
  bool publish_impl(const std::vector<model::AgentSnapshot>& snapshots);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::unordered_set<std::string> schema_ready_;
  bool timeseries_available_{true};
  float last_latency_ms_{0.0F};
};

}  // namespace turnwise::sinks
