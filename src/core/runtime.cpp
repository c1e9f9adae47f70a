#include "core/runtime.hpp"

#include <exception>
#include <string>
#include <utility>

#include "core/log.hpp"

namespace turnwise::core {
namespace {

CoordinatorConfig with_roster(CoordinatorConfig config, const std::size_t roster_size) {
  config.roster_size = roster_size;
  return config;
}

}  // namespace

Runtime::Runtime(RuntimeConfig config, ActionExecutor& executor)
    : config_(std::move(config)), coordinator_(with_roster(config_.coordinator, config_.agent_ids.size())) {
  for (const auto& agent_id : config_.agent_ids) {
    auto agent = std::make_unique<Agent>(make_agent_config(config_, agent_id), coordinator_, executor);
    agents_by_id_.emplace(agent_id, agent.get());
    agents_.push_back(std::move(agent));
  }

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        options.unix_socket.empty() ? options.host + ':' + std::to_string(options.port) : "unix://" + options.unix_socket;
    if (redis_sink_->check_connectivity()) {
      log(log_level::INFO, "runtime", "redis connectivity confirmed at ", address);
    } else {
      log(log_level::WARN, "runtime", "redis connectivity check failed at ", address);
    }
  }
}

Runtime::~Runtime() { stop(); }

void Runtime::start() {
  if (started_ || stopped_) {
    return;
  }
  started_ = true;

  agent_threads_.reserve(agents_.size());
  for (auto& agent : agents_) {
    Agent* raw = agent.get();
    agent_threads_.emplace_back([raw](std::stop_token stop) { raw->run(stop); });
  }
  housekeeping_thread_ = std::jthread([this](std::stop_token stop) { housekeeping_loop(stop); });
  log(log_level::INFO, "runtime", "started ", agents_.size(), " agents");
}

void Runtime::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  for (auto& thread : agent_threads_) {
    thread.request_stop();
  }
  housekeeping_thread_.request_stop();
  for (auto& agent : agents_) {
    agent->close_inbox();
  }
  coordinator_.shutdown();

  for (auto& thread : agent_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  if (housekeeping_thread_.joinable()) {
    housekeeping_thread_.join();
  }
  agent_threads_.clear();

  if (started_) {
    log(log_level::INFO, "runtime", "stopped");
  }
}

bool Runtime::deliver(const std::string& agent_id, model::Event event) {
  Agent* agent = agent_by_id(agent_id);
  if (agent == nullptr) {
    log(log_level::DEBUG, "runtime", "no agent named ", agent_id);
    return false;
  }
  const auto result = agent->deliver(std::move(event));
  return result == inbox::enqueue_result::QUEUED || result == inbox::enqueue_result::QUEUED_WITH_EVICTION;
}

std::size_t Runtime::broadcast(const model::Event& event) {
  std::size_t queued = 0;
  for (auto& agent : agents_) {
    if (deliver(agent->id(), event)) {
      ++queued;
    }
  }
  return queued;
}

bool Runtime::set_compute_budget(const std::string& agent_id, const float budget) {
  Agent* agent = agent_by_id(agent_id);
  if (agent == nullptr) {
    return false;
  }
  agent->set_compute_budget(budget);
  return true;
}

bool Runtime::reset_context(const std::string& agent_id, const std::string& context_id) {
  Agent* agent = agent_by_id(agent_id);
  if (agent == nullptr) {
    return false;
  }
  agent->reset_context(context_id);
  return true;
}

bool Runtime::reset_all_contexts(const std::string& agent_id) {
  Agent* agent = agent_by_id(agent_id);
  if (agent == nullptr) {
    return false;
  }
  agent->reset_all_contexts();
  return true;
}

void Runtime::housekeeping_once() {
  coordinator_.sweep();
  publish_sinks(inspect());
}

std::vector<model::AgentSnapshot> Runtime::inspect() const {
  std::vector<model::AgentSnapshot> snapshots;
  snapshots.reserve(agents_.size());
  for (const auto& agent : agents_) {
    snapshots.push_back(agent->snapshot());
  }
  return snapshots;
}

const Agent* Runtime::find_agent(const std::string& agent_id) const {
  const auto it = agents_by_id_.find(agent_id);
  return it == agents_by_id_.end() ? nullptr : it->second;
}

Agent* Runtime::agent_by_id(const std::string& agent_id) {
  const auto it = agents_by_id_.find(agent_id);
  return it == agents_by_id_.end() ? nullptr : it->second;
}

std::vector<std::string> Runtime::agent_ids() const { return config_.agent_ids; }

void Runtime::housekeeping_loop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    {
      std::unique_lock<std::mutex> lock(housekeeping_mutex_);
      housekeeping_cv_.wait_for(lock, stop, config_.publish_interval, [] { return false; });
    }
    if (stop.stop_requested()) {
      break;
    }

    try {
      housekeeping_once();
    } catch (const std::exception& ex) {
      log(log_level::WARN, "runtime", "housekeeping failed: ", ex.what());
    }
  }
}

void Runtime::publish_sinks(const std::vector<model::AgentSnapshot>& snapshots) {
  if (config_.stdout_debug) {
    for (const auto& snapshot : snapshots) {
      stdout_sink_.publish(snapshot);
    }
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(snapshots);
    if (!ok && redis_was_ok_) {
      log(log_level::WARN, "redis", "publish failed");
      redis_was_ok_ = false;
    } else if (ok && !redis_was_ok_) {
      log(log_level::INFO, "redis", "publish recovered");
      redis_was_ok_ = true;
    }
  }
}

}  // namespace turnwise::core
