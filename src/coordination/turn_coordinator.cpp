#include "coordination/turn_coordinator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

#include "core/log.hpp"
#include "core/math.hpp"

namespace turnwise::coordination {

namespace {

constexpr float kQuietRoomAverage = 0.4F;
constexpr float kQuietRoomFloor = 0.2F;

struct RankedIntent {
  const Intent* intent;
  float score;
};

std::string format_confidence(const float value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

const char* phase_name(const phase value) noexcept {
  switch (value) {
    case phase::GATHERING:
      return "gathering";
    case phase::DECIDING:
      return "deciding";
    case phase::DECIDED:
      return "decided";
  }
  return "unknown";
}

const char* rejection_reason_name(const rejection_reason value) noexcept {
  switch (value) {
    case rejection_reason::OUTRANKED:
      return "outranked";
    case rejection_reason::LOW_CONFIDENCE:
      return "low_confidence";
    case rejection_reason::LATE:
      return "late";
    case rejection_reason::WITHDRAWN:
      return "withdrawn";
  }
  return "unknown";
}

bool Decision::is_granted(const std::string& agent_id) const {
  return std::find(granted.begin(), granted.end(), agent_id) != granted.end();
}

TurnCoordinator::TurnCoordinator(core::CoordinatorConfig config)
    : config_(std::move(config)), window_(config_.gather_min, config_.gather_max, config_.gather_base) {
  stats_.gather_window = window_.window();
}

TurnCoordinator::~TurnCoordinator() { shutdown(); }

void TurnCoordinator::register_intent(const std::string& trigger_id, const std::string& agent_id,
                                      const float confidence, const std::string& context_id) {
  if (shutdown_.load()) {
    return;
  }

  const auto now = Clock::now();
  const auto context = acquire_context(trigger_id, context_id, now);
  if (context == nullptr) {
    count_rejection(rejection_reason::LATE);
    core::log(core::log_level::DEBUG, "coordinator", "intent from ", agent_id, " on retired ", trigger_id);
    return;
  }

  const std::lock_guard<std::mutex> lock(context->mutex);
  if (context->current == phase::DECIDED) {
    (void)finish_locked(*context, agent_id);
    core::log(core::log_level::DEBUG, "coordinator", "intent from ", agent_id, " on decided ", trigger_id);
    return;
  }

  add_intent_locked(*context, agent_id, confidence, now);
  if (early_exit_ready_locked(*context)) {
    decide_locked(*context, now);
    context->decided.notify_all();
  }
}

bool TurnCoordinator::request_turn(const std::string& agent_id, const std::string& trigger_id, const float confidence,
                                   const std::chrono::milliseconds timeout, std::stop_token stop,
                                   const std::string& context_id) {
  if (shutdown_.load()) {
    return false;
  }

  auto now = Clock::now();
  const auto context = acquire_context(trigger_id, context_id, now);
  if (context == nullptr) {
    count_rejection(rejection_reason::LATE);
    core::log(core::log_level::DEBUG, "coordinator", "late request from ", agent_id, " on retired ", trigger_id);
    return false;
  }
  const auto give_up_at = now + timeout;

  std::unique_lock<std::mutex> lock(context->mutex);
  if (context->current == phase::DECIDED) {
    return finish_locked(*context, agent_id);
  }

  add_intent_locked(*context, agent_id, confidence, now);
  if (early_exit_ready_locked(*context)) {
    decide_locked(*context, now);
    context->decided.notify_all();
    return finish_locked(*context, agent_id);
  }

  while (true) {
    const auto wake_at = std::min(context->gather_deadline, give_up_at);
    context->decided.wait_until(lock, stop, wake_at,
                                [&] { return context->current == phase::DECIDED || shutdown_.load(); });

    if (context->current == phase::DECIDED) {
      return finish_locked(*context, agent_id);
    }
    if (stop.stop_requested() || shutdown_.load()) {
      withdraw_locked(*context, agent_id);
      return false;
    }

    now = Clock::now();
    if (now >= context->gather_deadline) {
      decide_locked(*context, now);
      context->decided.notify_all();
      return finish_locked(*context, agent_id);
    }
    if (now >= give_up_at) {
      core::log(core::log_level::DEBUG, "coordinator", "turn timeout for ", agent_id, " on ", trigger_id);
      withdraw_locked(*context, agent_id);
      return false;
    }
  }
}

void TurnCoordinator::register_deferral(const std::string& trigger_id, const std::string& agent_id) {
  if (shutdown_.load()) {
    return;
  }
  const auto context = find_context(trigger_id);
  if (context == nullptr) {
    return;
  }

  const std::lock_guard<std::mutex> lock(context->mutex);
  if (context->current != phase::GATHERING) {
    return;
  }
  const auto same_agent = [&agent_id](const Intent& intent) { return intent.agent_id == agent_id; };
  if (std::any_of(context->intents.begin(), context->intents.end(), same_agent) ||
      std::any_of(context->withdrawn.begin(), context->withdrawn.end(), same_agent) ||
      std::find(context->deferred.begin(), context->deferred.end(), agent_id) != context->deferred.end()) {
    return;
  }

  context->deferred.push_back(agent_id);
  if (early_exit_ready_locked(*context)) {
    decide_locked(*context, Clock::now());
    context->decided.notify_all();
  }
}

std::optional<Decision> TurnCoordinator::decision(const std::string& trigger_id) const {
  const auto context = find_context(trigger_id);
  if (context == nullptr) {
    return std::nullopt;
  }
  const std::lock_guard<std::mutex> lock(context->mutex);
  if (context->decision == nullptr) {
    return std::nullopt;
  }
  return *context->decision;
}

std::optional<phase> TurnCoordinator::phase_of(const std::string& trigger_id) const {
  const auto context = find_context(trigger_id);
  if (context == nullptr) {
    return std::nullopt;
  }
  const std::lock_guard<std::mutex> lock(context->mutex);
  return context->current;
}

std::size_t TurnCoordinator::sweep(const Clock::time_point now) {
  std::size_t erased = 0;
  const std::lock_guard<std::mutex> registry_lock(registry_mutex_);
  for (auto it = contexts_.begin(); it != contexts_.end();) {
    auto& context = *it->second;
    bool expired = false;
    {
      const std::lock_guard<std::mutex> lock(context.mutex);
      if (context.current == phase::GATHERING && now >= context.gather_deadline) {
        decide_locked(context, now);
        context.decided.notify_all();
      } else if (context.current == phase::DECIDED && now - context.decided_at > config_.retention) {
        expired = true;
      }
    }

    if (expired) {
      retired_[it->first] = now;
      it = contexts_.erase(it);
      ++erased;
    } else {
      ++it;
    }
  }

  for (auto it = retired_.begin(); it != retired_.end();) {
    if (now - it->second > config_.retention) {
      it = retired_.erase(it);
    } else {
      ++it;
    }
  }

  if (erased > 0) {
    core::log(core::log_level::DEBUG, "coordinator", "sweep erased ", erased, " contexts; ", contexts_.size(),
              " active");
  }
  return erased;
}

void TurnCoordinator::observe_latency(const std::chrono::milliseconds latency) {
  const std::lock_guard<std::mutex> lock(window_mutex_);
  window_.observe(latency);
}

std::chrono::milliseconds TurnCoordinator::gather_window() const {
  const std::lock_guard<std::mutex> lock(window_mutex_);
  return window_.window();
}

CoordinatorStats TurnCoordinator::stats() const {
  CoordinatorStats snapshot{};
  {
    const std::lock_guard<std::mutex> lock(stats_mutex_);
    snapshot = stats_;
  }
  {
    const std::lock_guard<std::mutex> lock(registry_mutex_);
    snapshot.active_contexts = contexts_.size();
  }
  snapshot.gather_window = gather_window();
  return snapshot;
}

void TurnCoordinator::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  const std::lock_guard<std::mutex> registry_lock(registry_mutex_);
  for (auto& [_, context] : contexts_) {
    const std::lock_guard<std::mutex> lock(context->mutex);
    context->decided.notify_all();
  }
}

std::shared_ptr<TurnCoordinator::CoordinationContext> TurnCoordinator::acquire_context(
    const std::string& trigger_id, const std::string& context_id, const Clock::time_point now) {
  const std::lock_guard<std::mutex> lock(registry_mutex_);
  if (retired_.count(trigger_id) != 0) {
    return nullptr;
  }
  auto& slot = contexts_[trigger_id];
  if (slot == nullptr) {
    slot = std::make_shared<CoordinationContext>();
    slot->trigger_id = trigger_id;
    slot->context_id = context_id.empty() ? trigger_id : context_id;
    slot->created = now;
    slot->last_intent = now;
    slot->gather_deadline = now + gather_window();
    core::log(core::log_level::DEBUG, "coordinator", "gathering ", trigger_id, " for ",
              std::chrono::duration_cast<std::chrono::milliseconds>(slot->gather_deadline - now).count(), "ms");
  }
  return slot;
}

std::shared_ptr<TurnCoordinator::CoordinationContext> TurnCoordinator::find_context(
    const std::string& trigger_id) const {
  const std::lock_guard<std::mutex> lock(registry_mutex_);
  const auto it = contexts_.find(trigger_id);
  return it == contexts_.end() ? nullptr : it->second;
}

void TurnCoordinator::add_intent_locked(CoordinationContext& context, const std::string& agent_id,
                                        const float confidence, const Clock::time_point now) {
  const auto existing = std::find_if(context.intents.begin(), context.intents.end(),
                                     [&agent_id](const Intent& intent) { return intent.agent_id == agent_id; });
  if (existing != context.intents.end()) {
    return;
  }

  context.withdrawn.erase(std::remove_if(context.withdrawn.begin(), context.withdrawn.end(),
                                         [&agent_id](const Intent& intent) { return intent.agent_id == agent_id; }),
                          context.withdrawn.end());
  context.deferred.erase(std::remove(context.deferred.begin(), context.deferred.end(), agent_id),
                         context.deferred.end());
  context.intents.push_back(Intent{agent_id, core::clamp01(confidence), now, context.next_order++});
  context.last_intent = now;
}

void TurnCoordinator::withdraw_locked(CoordinationContext& context, const std::string& agent_id) {
  if (context.current != phase::GATHERING) {
    return;
  }
  const auto it = std::find_if(context.intents.begin(), context.intents.end(),
                               [&agent_id](const Intent& intent) { return intent.agent_id == agent_id; });
  if (it == context.intents.end()) {
    return;
  }
  context.withdrawn.push_back(*it);
  context.intents.erase(it);
}

bool TurnCoordinator::early_exit_ready_locked(const CoordinationContext& context) const {
  if (context.current != phase::GATHERING || context.intents.empty()) {
    return false;
  }
  const bool confident = std::any_of(context.intents.begin(), context.intents.end(), [this](const Intent& intent) {
    return intent.confidence >= config_.early_decision_confidence;
  });
  if (confident && context.intents.size() >= 2) {
    return true;
  }

  // Every agent on the roster has claimed, withdrawn or deferred.
  const std::size_t answered = context.intents.size() + context.withdrawn.size() + context.deferred.size();
  return config_.roster_size > 0 && answered >= config_.roster_size;
}

void TurnCoordinator::decide_locked(CoordinationContext& context, const Clock::time_point now) {
  if (context.current == phase::DECIDED) {
    return;
  }
  context.current = phase::DECIDING;

  std::vector<RankedIntent> ranked;
  ranked.reserve(context.intents.size());
  for (const auto& intent : context.intents) {
    ranked.push_back(RankedIntent{&intent, intent.confidence - recency_penalty(context.context_id, intent.agent_id)});
  }
  std::sort(ranked.begin(), ranked.end(), [](const RankedIntent& lhs, const RankedIntent& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    if (lhs.intent->confidence != rhs.intent->confidence) {
      return lhs.intent->confidence > rhs.intent->confidence;
    }
    return lhs.intent->order < rhs.intent->order;
  });

  auto decision = std::make_shared<Decision>();
  decision->trigger_id = context.trigger_id;
  decision->context_id = context.context_id;
  std::vector<std::string> reasoning;

  if (ranked.size() == 1) {
    const auto& only = *ranked.front().intent;
    decision->granted.push_back(only.agent_id);
    reasoning.push_back(only.agent_id + " is only claimant (conf=" + format_confidence(only.confidence) + ")");
  } else if (ranked.empty()) {
    reasoning.emplace_back("no intents");
  } else {
    float sum = 0.0F;
    for (const auto& item : ranked) {
      sum += item.intent->confidence;
    }
    const float average = sum / static_cast<float>(ranked.size());
    const float floor = average < kQuietRoomAverage ? std::min(kQuietRoomFloor, config_.min_confidence)
                                                    : config_.min_confidence;

    for (const auto& item : ranked) {
      const auto& intent = *item.intent;
      if (decision->granted.size() >= config_.max_responders) {
        decision->rejections.push_back(Rejection{intent.agent_id, rejection_reason::OUTRANKED, intent.confidence});
        reasoning.push_back(intent.agent_id + " outranked (score=" + format_confidence(item.score) + ")");
      } else if (intent.confidence < floor) {
        decision->rejections.push_back(
            Rejection{intent.agent_id, rejection_reason::LOW_CONFIDENCE, intent.confidence});
        reasoning.push_back(intent.agent_id + " below threshold (conf=" + format_confidence(intent.confidence) +
                            " < " + format_confidence(floor) + ")");
      } else {
        decision->granted.push_back(intent.agent_id);
        reasoning.push_back(intent.agent_id + " granted (conf=" + format_confidence(intent.confidence) +
                            ", score=" + format_confidence(item.score) + ")");
      }
    }
  }

  for (const auto& intent : context.withdrawn) {
    decision->rejections.push_back(Rejection{intent.agent_id, rejection_reason::WITHDRAWN, intent.confidence});
  }
  for (const auto& rejection : decision->rejections) {
    decision->denied.push_back(rejection.agent_id);
  }
  decision->deferred = context.deferred;

  std::ostringstream joined;
  for (std::size_t i = 0; i < reasoning.size(); ++i) {
    joined << (i == 0 ? "" : "; ") << reasoning[i];
  }
  decision->reasoning = joined.str();
  decision->duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - context.created);

  track_grants(context.context_id, decision->granted);
  if (context.intents.size() >= 2) {
    observe_latency(std::chrono::duration_cast<std::chrono::milliseconds>(context.last_intent - context.created));
  }
  {
    const std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.total_decisions;
    stats_.total_grants += decision->granted.size();
    for (const auto& rejection : decision->rejections) {
      ++stats_.rejections[static_cast<std::size_t>(rejection.reason)];
    }
  }

  core::log(core::log_level::DEBUG, "coordinator", "decided ", context.trigger_id, ": ", decision->granted.size(),
            " granted, ", decision->denied.size(), " denied in ", decision->duration.count(), "ms (",
            decision->reasoning, ")");

  context.decision = std::move(decision);
  context.decided_at = now;
  context.current = phase::DECIDED;
}

bool TurnCoordinator::finish_locked(CoordinationContext& context, const std::string& agent_id) {
  const bool granted = context.decision->is_granted(agent_id);
  const bool participated =
      std::any_of(context.intents.begin(), context.intents.end(),
                  [&agent_id](const Intent& intent) { return intent.agent_id == agent_id; });
  if (!participated) {
    count_rejection(rejection_reason::LATE);
  }
  return granted;
}

float TurnCoordinator::recency_penalty(const std::string& context_id, const std::string& agent_id) const {
  const std::lock_guard<std::mutex> lock(recency_mutex_);
  const auto it = recent_responders_.find(context_id);
  if (it == recent_responders_.end() || it->second.empty()) {
    return 0.0F;
  }

  const auto& recent = it->second;
  const auto position = std::find(recent.begin(), recent.end(), agent_id);
  if (position == recent.end()) {
    return 0.0F;
  }
  const float index = static_cast<float>(std::distance(recent.begin(), position));
  return config_.recency_penalty * (1.0F - (index / static_cast<float>(recent.size())));
}

void TurnCoordinator::track_grants(const std::string& context_id, const std::vector<std::string>& granted) {
  if (config_.recent_responders == 0 || granted.empty()) {
    return;
  }

  const std::lock_guard<std::mutex> lock(recency_mutex_);
  auto& recent = recent_responders_[context_id];
  for (auto it = granted.rbegin(); it != granted.rend(); ++it) {
    recent.erase(std::remove(recent.begin(), recent.end(), *it), recent.end());
    recent.push_front(*it);
  }
  while (recent.size() > config_.recent_responders) {
    recent.pop_back();
  }
}

void TurnCoordinator::count_rejection(const rejection_reason reason) {
  const std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.rejections[static_cast<std::size_t>(reason)];
}

}  // namespace turnwise::coordination
