#include "core/agent.hpp"

#include <exception>
#include <string>
#include <unordered_set>
#include <utility>

#include "core/log.hpp"

namespace turnwise::core {

Agent::Agent(AgentConfig config, coordination::TurnCoordinator& coordinator, ActionExecutor& executor)
    : config_(std::move(config)),
      coordinator_(coordinator),
      executor_(executor),
      inbox_(config_.inbox.capacity),
      state_(config_.cadence, config_.compute_budget),
      rate_limiter_(config_.rate_limit) {
  published_.agent_id = config_.id;
  published_.state = state_.snapshot();
}

inbox::enqueue_result Agent::deliver(model::Event event) {
  const std::string event_id = event.id;
  const auto result = inbox_.enqueue(std::move(event));
  if (result == inbox::enqueue_result::DROPPED || result == inbox::enqueue_result::CLOSED) {
    log(log_level::DEBUG, "agent:" + config_.id, "event ", event_id, " ", inbox::enqueue_result_name(result));
  }
  return result;
}

void Agent::run_cycle(std::stop_token stop) {
  apply_pending_requests();
  ++stats_.cycles;

  const auto rested = rest(state_.cadence(), stop);
  state_.rest(rested);
  if (stop.stop_requested()) {
    publish_snapshot();
    return;
  }

  if (config_.inbox.max_age.count() > 0) {
    const auto expired = inbox_.expire_older_than(config_.inbox.max_age);
    if (expired > 0) {
      log(log_level::DEBUG, "agent:" + config_.id, "expired ", expired, " stale events");
    }
  }

  const auto candidates = inbox_.peek(config_.peek_depth);
  std::unordered_set<std::string> limited_contexts;
  const model::InboxEntry* chosen = nullptr;
  for (const auto& candidate : candidates) {
    const auto& context_id = candidate.event.context_id;
    if (limited_contexts.count(context_id) != 0) {
      coordinator_.register_deferral(candidate.event.id, config_.id);
      continue;
    }
    if (rate_limiter_.is_rate_limited(context_id)) {
      limited_contexts.insert(context_id);
      ++stats_.rate_limited_skips;
      log(log_level::DEBUG, "agent:" + config_.id, "rate limited in ", context_id, "; skipping this cycle");
      coordinator_.register_deferral(candidate.event.id, config_.id);
      continue;
    }
    if (!state_.should_engage(candidate.event)) {
      log(log_level::DEBUG, "agent:" + config_.id, "not engaging ", candidate.event.id,
          " priority=", candidate.event.priority, " mood=", model::mood_name(state_.current_mood()));
      coordinator_.register_deferral(candidate.event.id, config_.id);
      continue;
    }
    chosen = &candidate;
    break;
  }

  if (chosen != nullptr) {
    engage(*chosen, stop);
  }

  state_.update_inbox_load(inbox_.size());
  publish_snapshot();
}

void Agent::run(std::stop_token stop) {
  log(log_level::INFO, "agent:" + config_.id, "loop started");
  while (!stop.stop_requested()) {
    try {
      run_cycle(stop);
    } catch (const std::exception& ex) {
      ++stats_.loop_faults;
      const auto backoff = state_.cadence() * 2;
      log(log_level::WARN, "agent:" + config_.id, "cycle failed: ", ex.what(), "; backing off ", backoff.count(), "ms");
      (void)rest(backoff, stop);
    } catch (...) {
      ++stats_.loop_faults;
      const auto backoff = state_.cadence() * 2;
      log(log_level::WARN, "agent:" + config_.id, "cycle failed with a non-standard exception; backing off ",
          backoff.count(), "ms");
      (void)rest(backoff, stop);
    }
  }
  publish_snapshot();
  log(log_level::INFO, "agent:" + config_.id, "loop stopped");
}

void Agent::set_compute_budget(const float budget) {
  const std::lock_guard<std::mutex> lock(requests_mutex_);
  pending_compute_budget_ = budget;
}

void Agent::reset_context(const std::string& context_id) {
  const std::lock_guard<std::mutex> lock(requests_mutex_);
  pending_resets_.push_back(context_id);
}

void Agent::reset_all_contexts() {
  const std::lock_guard<std::mutex> lock(requests_mutex_);
  pending_reset_all_ = true;
}

model::AgentSnapshot Agent::snapshot() const {
  model::AgentSnapshot copy{};
  {
    const std::lock_guard<std::mutex> lock(snapshot_mutex_);
    copy = published_;
  }
  copy.inbox_depth = inbox_.size();
  return copy;
}

std::chrono::milliseconds Agent::rest(const std::chrono::milliseconds duration, std::stop_token stop) {
  const auto start = model::Clock::now();
  {
    std::unique_lock<std::mutex> lock(rest_mutex_);
    rest_cv_.wait_for(lock, stop, duration, [] { return false; });
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(model::Clock::now() - start);
}

void Agent::apply_pending_requests() {
  std::optional<float> budget;
  std::vector<std::string> resets;
  bool reset_all = false;
  {
    const std::lock_guard<std::mutex> lock(requests_mutex_);
    budget = std::exchange(pending_compute_budget_, std::nullopt);
    resets.swap(pending_resets_);
    reset_all = std::exchange(pending_reset_all_, false);
  }

  if (budget.has_value()) {
    state_.update_compute_budget(*budget);
  }
  if (reset_all) {
    rate_limiter_.reset_all();
  }
  for (const auto& context_id : resets) {
    rate_limiter_.reset(context_id);
  }
}

void Agent::engage(const model::InboxEntry& entry, std::stop_token stop) {
  ++stats_.engagements;
  const bool granted = coordinator_.request_turn(config_.id, entry.event.id, entry.event.priority,
                                                 config_.turn_timeout, stop, entry.event.context_id);
  if (!granted) {
    ++stats_.turns_denied;
    if (!stop.stop_requested()) {
      (void)inbox_.take(entry);
    }
    log(log_level::DEBUG, "agent:" + config_.id, "turn denied for ", entry.event.id);
    return;
  }

  ++stats_.turns_granted;
  auto taken = inbox_.take(entry);
  if (!taken.has_value()) {
    log(log_level::WARN, "agent:" + config_.id, "granted event ", entry.event.id, " left the inbox before dispatch");
    return;
  }
  dispatch(taken->event);
}

void Agent::dispatch(const model::Event& event) {
  const auto start = model::Clock::now();
  ActionResult result{};
  std::string failure;
  try {
    result = executor_.execute(config_.id, event);
    if (!result.ok) {
      failure = result.detail.empty() ? "executor reported failure" : result.detail;
    }
  } catch (const std::exception& ex) {
    result.ok = false;
    result.complexity = 1.0F;
    failure = ex.what();
  } catch (...) {
    result.ok = false;
    result.complexity = 1.0F;
    failure = "non-standard exception";
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(model::Clock::now() - start);

  state_.record_activity(elapsed, result.complexity);
  if (result.ok) {
    rate_limiter_.record_response(event.context_id);
    ++stats_.actions_succeeded;
    return;
  }

  ++stats_.actions_failed;
  log(log_level::WARN, "agent:" + config_.id, "action on ", event.id, " failed: ", failure);
}

void Agent::publish_snapshot() {
  model::AgentSnapshot next{};
  next.agent_id = config_.id;
  next.state = state_.snapshot();
  next.rate_limits = rate_limiter_.all_rate_limit_info();
  next.inbox_depth = inbox_.size();
  next.stats = stats_;

  const std::lock_guard<std::mutex> lock(snapshot_mutex_);
  published_ = std::move(next);
}

}  // namespace turnwise::core
