#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <latch>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "coordination/gather_window.hpp"
#include "coordination/turn_coordinator.hpp"
#include "core/config.hpp"

using turnwise::coordination::Decision;
using turnwise::coordination::GatherWindow;
using turnwise::coordination::TurnCoordinator;
using turnwise::coordination::phase;
using turnwise::coordination::rejection_reason;
using turnwise::core::CoordinatorConfig;
using Clock = turnwise::model::Clock;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

CoordinatorConfig make_config(std::size_t max_responders, std::chrono::milliseconds gather,
                              float early_decision_confidence = 0.9F) {
  CoordinatorConfig config{};
  config.max_responders = max_responders;
  config.gather_min = gather;
  config.gather_max = gather;
  config.gather_base = gather;
  config.early_decision_confidence = early_decision_confidence;
  return config;
}

const turnwise::coordination::Rejection* find_rejection(const Decision& decision, const std::string& agent_id) {
  const auto it = std::find_if(decision.rejections.begin(), decision.rejections.end(),
                               [&agent_id](const auto& rejection) { return rejection.agent_id == agent_id; });
  return it == decision.rejections.end() ? nullptr : &*it;
}

int test_single_grant_and_late_caller_gets_cached_denial() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));

  coordinator.register_intent("T1", "alpha", 0.9F);
  coordinator.register_intent("T1", "beta", 0.6F);

  if (coordinator.phase_of("T1") != phase::DECIDED) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "high confidence pair should decide early");
  }

  const auto decision = coordinator.decision("T1");
  if (!decision.has_value() || decision->granted != std::vector<std::string>{"alpha"} ||
      decision->denied != std::vector<std::string>{"beta"}) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "0.9 should be granted over 0.6");
  }
  const auto* beta = find_rejection(*decision, "beta");
  if (beta == nullptr || beta->reason != rejection_reason::OUTRANKED) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "beta should be rejected as outranked");
  }
  if (decision->reasoning.empty()) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "decision should carry reasoning");
  }

  if (!coordinator.request_turn("alpha", "T1", 0.9F, std::chrono::seconds(1))) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "granted agent should read its grant");
  }

  const auto start = Clock::now();
  const bool late = coordinator.request_turn("gamma", "T1", 1.0F, std::chrono::seconds(5));
  if (late || Clock::now() - start > std::chrono::milliseconds(500)) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "late caller should be denied immediately");
  }

  const auto after = coordinator.decision("T1");
  if (after->granted != decision->granted || after->denied != decision->denied) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "decision changed after it was made");
  }

  const auto stats = coordinator.stats();
  if (stats.total_decisions != 1 || stats.total_grants != 1 ||
      stats.rejections[static_cast<std::size_t>(rejection_reason::LATE)] != 1) {
    return fail("test_single_grant_and_late_caller_gets_cached_denial", "stats mismatch");
  }

  return 0;
}

int test_fan_out_grants_top_k() {
  TurnCoordinator coordinator(make_config(2, std::chrono::seconds(5), 0.95F));

  coordinator.register_intent("T", "a", 0.9F);
  coordinator.register_intent("T", "b", 0.7F);
  coordinator.register_intent("T", "c", 0.5F);
  if (coordinator.phase_of("T") != phase::GATHERING) {
    return fail("test_fan_out_grants_top_k", "no intent reaches the early threshold");
  }

  coordinator.sweep(Clock::now() + std::chrono::seconds(10));

  const auto decision = coordinator.decision("T");
  if (!decision.has_value() || decision->granted != std::vector<std::string>{"a", "b"}) {
    return fail("test_fan_out_grants_top_k", "two highest confidences should both be granted");
  }
  const auto* c = find_rejection(*decision, "c");
  if (c == nullptr || c->reason != rejection_reason::OUTRANKED || decision->denied != std::vector<std::string>{"c"}) {
    return fail("test_fan_out_grants_top_k", "third claimant should be outranked");
  }

  return 0;
}

int test_duplicate_intent_is_idempotent() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));
  coordinator.register_intent("T", "a", 0.4F);
  coordinator.register_intent("T", "a", 0.95F);

  // The duplicate neither counts as a second claimant nor raises confidence.
  if (coordinator.phase_of("T") != phase::GATHERING) {
    return fail("test_duplicate_intent_is_idempotent", "duplicate intent must not trigger early decision");
  }

  coordinator.register_intent("T", "b", 0.5F);
  coordinator.sweep(Clock::now() + std::chrono::seconds(10));
  const auto decision = coordinator.decision("T");
  if (!decision.has_value() || decision->granted != std::vector<std::string>{"b"}) {
    return fail("test_duplicate_intent_is_idempotent", "first intent confidence should be kept");
  }

  return 0;
}

int test_recency_penalty_rotates_responders() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));
  const auto later = [] { return Clock::now() + std::chrono::seconds(10); };

  coordinator.register_intent("T1", "a", 0.8F, "room");
  coordinator.register_intent("T1", "b", 0.7F, "room");
  coordinator.sweep(later());
  if (!coordinator.decision("T1")->is_granted("a")) {
    return fail("test_recency_penalty_rotates_responders", "a should win the first trigger");
  }

  coordinator.register_intent("T2", "a", 0.8F, "room");
  coordinator.register_intent("T2", "b", 0.7F, "room");
  coordinator.sweep(later());
  if (!coordinator.decision("T2")->is_granted("b")) {
    return fail("test_recency_penalty_rotates_responders", "recent responder a should yield to b");
  }

  coordinator.register_intent("T3", "a", 0.8F, "room");
  coordinator.register_intent("T3", "b", 0.7F, "room");
  coordinator.sweep(later());
  if (!coordinator.decision("T3")->is_granted("a")) {
    return fail("test_recency_penalty_rotates_responders", "penalty should fade with position");
  }

  // A different context has no history.
  coordinator.register_intent("T4", "a", 0.8F, "hall");
  coordinator.register_intent("T4", "b", 0.7F, "hall");
  coordinator.sweep(later());
  if (!coordinator.decision("T4")->is_granted("a")) {
    return fail("test_recency_penalty_rotates_responders", "recency must be tracked per context");
  }

  return 0;
}

int test_single_claimant_is_granted_regardless_of_confidence() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));
  coordinator.register_intent("T", "solo", 0.05F);
  coordinator.sweep(Clock::now() + std::chrono::seconds(10));

  const auto decision = coordinator.decision("T");
  if (!decision.has_value() || decision->granted != std::vector<std::string>{"solo"} || !decision->denied.empty()) {
    return fail("test_single_claimant_is_granted_regardless_of_confidence", "only claimant should be granted");
  }

  return 0;
}

int test_confidence_floor_and_quiet_room() {
  TurnCoordinator coordinator(make_config(3, std::chrono::seconds(5)));

  coordinator.register_intent("busy", "a", 0.7F);
  coordinator.register_intent("busy", "b", 0.2F);
  coordinator.sweep(Clock::now() + std::chrono::seconds(10));
  const auto busy = coordinator.decision("busy");
  const auto* b = find_rejection(*busy, "b");
  if (busy->granted != std::vector<std::string>{"a"} || b == nullptr || b->reason != rejection_reason::LOW_CONFIDENCE) {
    return fail("test_confidence_floor_and_quiet_room", "0.2 should fall under the default floor");
  }

  coordinator.register_intent("quiet", "a", 0.35F);
  coordinator.register_intent("quiet", "b", 0.25F);
  coordinator.register_intent("quiet", "c", 0.1F);
  coordinator.sweep(Clock::now() + std::chrono::seconds(10));
  const auto quiet = coordinator.decision("quiet");
  const auto* c = find_rejection(*quiet, "c");
  if (quiet->granted != std::vector<std::string>{"a", "b"} || c == nullptr ||
      c->reason != rejection_reason::LOW_CONFIDENCE) {
    return fail("test_confidence_floor_and_quiet_room", "low average confidence should lower the floor to 0.2");
  }

  const auto stats = coordinator.stats();
  if (stats.rejections[static_cast<std::size_t>(rejection_reason::LOW_CONFIDENCE)] != 2) {
    return fail("test_confidence_floor_and_quiet_room", "low confidence rejections not counted");
  }

  return 0;
}

int test_early_exit_needs_two_claimants() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));

  coordinator.register_intent("T", "a", 0.95F);
  if (coordinator.phase_of("T") != phase::GATHERING) {
    return fail("test_early_exit_needs_two_claimants", "a lone confident claimant should keep gathering");
  }

  const auto start = Clock::now();
  const bool granted = coordinator.request_turn("b", "T", 0.3F, std::chrono::seconds(5));
  if (granted || Clock::now() - start > std::chrono::seconds(1)) {
    return fail("test_early_exit_needs_two_claimants", "second claimant should trigger an immediate decision");
  }
  if (!coordinator.decision("T")->is_granted("a")) {
    return fail("test_early_exit_needs_two_claimants", "confident claimant should be granted");
  }

  return 0;
}

int test_request_turn_decides_at_gather_deadline() {
  TurnCoordinator coordinator(make_config(1, std::chrono::milliseconds(60)));

  const auto start = Clock::now();
  const bool granted = coordinator.request_turn("a", "T", 0.5F, std::chrono::seconds(5));
  const auto waited = Clock::now() - start;
  if (!granted) {
    return fail("test_request_turn_decides_at_gather_deadline", "sole requester should be granted at deadline");
  }
  if (waited < std::chrono::milliseconds(50) || waited > std::chrono::seconds(2)) {
    return fail("test_request_turn_decides_at_gather_deadline", "decision should land at the gather deadline");
  }

  return 0;
}

int test_timeout_withdraws_intent() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));

  const auto start = Clock::now();
  const bool granted = coordinator.request_turn("a", "T", 0.9F, std::chrono::milliseconds(30));
  if (granted || Clock::now() - start > std::chrono::seconds(2)) {
    return fail("test_timeout_withdraws_intent", "timed out request should return false promptly");
  }
  if (coordinator.phase_of("T") != phase::GATHERING) {
    return fail("test_timeout_withdraws_intent", "timeout must not decide the context");
  }

  coordinator.register_intent("T", "b", 0.4F);
  coordinator.sweep(Clock::now() + std::chrono::seconds(10));

  const auto decision = coordinator.decision("T");
  const auto* a = find_rejection(*decision, "a");
  if (!decision->is_granted("b") || a == nullptr || a->reason != rejection_reason::WITHDRAWN) {
    return fail("test_timeout_withdraws_intent", "withdrawn agent must be recorded and not granted");
  }

  return 0;
}

int test_stop_token_and_shutdown_release_waiters() {
  TurnCoordinator coordinator(make_config(1, std::chrono::seconds(5)));

  std::stop_source source;
  std::thread stopper([&source] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    source.request_stop();
  });
  const auto start = Clock::now();
  const bool stopped = coordinator.request_turn("a", "T", 0.5F, std::chrono::seconds(5), source.get_token());
  stopper.join();
  if (stopped || Clock::now() - start > std::chrono::seconds(2)) {
    return fail("test_stop_token_and_shutdown_release_waiters", "stop request should release the waiter");
  }

  std::atomic<bool> result{true};
  std::thread waiter([&coordinator, &result] {
    result = coordinator.request_turn("b", "U", 0.5F, std::chrono::seconds(5));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  coordinator.shutdown();
  waiter.join();
  if (result.load()) {
    return fail("test_stop_token_and_shutdown_release_waiters", "shutdown should deny pending requests");
  }
  if (coordinator.request_turn("c", "V", 0.9F, std::chrono::seconds(1))) {
    return fail("test_stop_token_and_shutdown_release_waiters", "requests after shutdown must be denied");
  }

  return 0;
}

int test_sweep_retires_decided_contexts() {
  auto config = make_config(1, std::chrono::seconds(5));
  config.retention = std::chrono::seconds(1);
  TurnCoordinator coordinator(config);

  coordinator.register_intent("old", "a", 0.9F);
  coordinator.register_intent("old", "b", 0.95F);
  coordinator.register_intent("open", "a", 0.5F);

  const auto t0 = Clock::now();
  if (coordinator.sweep(t0) != 0 || coordinator.stats().active_contexts != 2) {
    return fail("test_sweep_retires_decided_contexts", "fresh contexts must survive a sweep");
  }

  if (coordinator.sweep(t0 + std::chrono::seconds(6)) != 1) {
    return fail("test_sweep_retires_decided_contexts", "expired decided context should be erased");
  }
  if (coordinator.phase_of("old").has_value()) {
    return fail("test_sweep_retires_decided_contexts", "erased context should be gone");
  }
  if (coordinator.phase_of("open") != phase::DECIDED) {
    return fail("test_sweep_retires_decided_contexts", "overdue gathering context should be decided by sweep");
  }

  if (coordinator.sweep(t0 + std::chrono::seconds(8)) != 1 || coordinator.stats().active_contexts != 0) {
    return fail("test_sweep_retires_decided_contexts", "swept-decided context should retire after retention");
  }

  // A trigger reused after retirement starts a fresh round.
  coordinator.register_intent("old", "c", 0.5F);
  if (coordinator.phase_of("old") != phase::GATHERING) {
    return fail("test_sweep_retires_decided_contexts", "retired trigger should gather again");
  }

  return 0;
}

int test_retired_trigger_denies_late_requests() {
  auto config = make_config(1, std::chrono::seconds(5));
  config.retention = std::chrono::seconds(1);
  TurnCoordinator coordinator(config);

  coordinator.register_intent("E1", "alpha", 0.95F);
  coordinator.register_intent("E1", "gamma", 0.5F);
  if (!coordinator.decision("E1").has_value() || !coordinator.decision("E1")->is_granted("alpha")) {
    return fail("test_retired_trigger_denies_late_requests", "alpha should hold the only turn");
  }

  const auto t0 = Clock::now();
  if (coordinator.sweep(t0 + std::chrono::seconds(2)) != 1) {
    return fail("test_retired_trigger_denies_late_requests", "decided context should be erased");
  }

  const auto late_before = coordinator.stats().rejections[static_cast<std::size_t>(rejection_reason::LATE)];
  const auto start = Clock::now();
  if (coordinator.request_turn("beta", "E1", 0.99F, std::chrono::seconds(5))) {
    return fail("test_retired_trigger_denies_late_requests", "late requester must not win a second turn");
  }
  if (Clock::now() - start > std::chrono::seconds(1)) {
    return fail("test_retired_trigger_denies_late_requests", "retired trigger should answer immediately");
  }
  coordinator.register_intent("E1", "delta", 0.9F);

  const auto stats = coordinator.stats();
  if (stats.rejections[static_cast<std::size_t>(rejection_reason::LATE)] != late_before + 2 ||
      stats.total_grants != 1 || coordinator.phase_of("E1").has_value()) {
    return fail("test_retired_trigger_denies_late_requests", "late arrivals should be counted without reopening");
  }

  // The tombstone lasts one more retention period.
  coordinator.sweep(t0 + std::chrono::seconds(4));
  coordinator.register_intent("E1", "delta", 0.9F);
  if (coordinator.phase_of("E1") != phase::GATHERING) {
    return fail("test_retired_trigger_denies_late_requests", "expired tombstone should allow a fresh round");
  }

  return 0;
}

int test_roster_deferrals_decide_early() {
  auto config = make_config(1, std::chrono::seconds(5));
  config.roster_size = 3;
  TurnCoordinator coordinator(config);

  coordinator.register_deferral("U", "a");
  if (coordinator.phase_of("U").has_value()) {
    return fail("test_roster_deferrals_decide_early", "deferral must not open a context");
  }

  coordinator.register_intent("T", "a", 0.5F);
  coordinator.register_deferral("T", "b");
  coordinator.register_deferral("T", "b");
  if (coordinator.phase_of("T") != phase::GATHERING) {
    return fail("test_roster_deferrals_decide_early", "context should gather until every agent answered");
  }
  coordinator.register_deferral("T", "c");
  const auto decided = coordinator.decision("T");
  if (!decided.has_value() || decided->granted != std::vector<std::string>{"a"} || !decided->denied.empty() ||
      decided->deferred != std::vector<std::string>{"b", "c"}) {
    return fail("test_roster_deferrals_decide_early", "all-answered roster should decide with deferrals listed");
  }

  coordinator.register_intent("V", "a", 0.5F);
  coordinator.register_deferral("V", "b");
  coordinator.register_intent("V", "b", 0.6F);
  if (coordinator.phase_of("V") != phase::GATHERING) {
    return fail("test_roster_deferrals_decide_early", "a deferral turned claim counts once");
  }
  coordinator.register_deferral("V", "c");
  const auto reclaimed = coordinator.decision("V");
  if (!reclaimed.has_value() || !reclaimed->is_granted("b") || reclaimed->deferred != std::vector<std::string>{"c"}) {
    return fail("test_roster_deferrals_decide_early", "later claim should replace the deferral");
  }

  auto pair_config = make_config(1, std::chrono::seconds(5));
  pair_config.roster_size = 2;
  TurnCoordinator pair(pair_config);
  pair.register_intent("W", "a", 0.5F);
  std::thread decliner([&pair] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pair.register_deferral("W", "b");
  });
  const auto start = Clock::now();
  const bool granted = pair.request_turn("a", "W", 0.5F, std::chrono::seconds(10));
  decliner.join();
  if (!granted || Clock::now() - start > std::chrono::seconds(2)) {
    return fail("test_roster_deferrals_decide_early", "lone claimant should not wait out the window");
  }

  return 0;
}

int test_gather_window_adapts_within_bounds() {
  GatherWindow window(std::chrono::milliseconds(50), std::chrono::milliseconds(1000), std::chrono::milliseconds(100));
  if (window.window() != std::chrono::milliseconds(150)) {
    return fail("test_gather_window_adapts_within_bounds", "initial window should be 1.5x base latency");
  }

  window.observe(std::chrono::milliseconds(300));
  if (window.window() != std::chrono::milliseconds(240)) {
    return fail("test_gather_window_adapts_within_bounds", "EWMA update mismatch");
  }

  for (int i = 0; i < 50; ++i) {
    window.observe(std::chrono::milliseconds(10000));
  }
  if (window.window() != std::chrono::milliseconds(1000)) {
    return fail("test_gather_window_adapts_within_bounds", "window must clamp to max");
  }

  for (int i = 0; i < 100; ++i) {
    window.observe(std::chrono::milliseconds(0));
  }
  if (window.window() != std::chrono::milliseconds(50)) {
    return fail("test_gather_window_adapts_within_bounds", "window must clamp to min");
  }

  CoordinatorConfig config{};
  config.gather_min = std::chrono::milliseconds(100);
  config.gather_max = std::chrono::milliseconds(5000);
  config.gather_base = std::chrono::milliseconds(1000);
  TurnCoordinator coordinator(config);
  const auto before = coordinator.gather_window();
  coordinator.observe_latency(std::chrono::milliseconds(100));
  if (coordinator.gather_window() >= before || coordinator.stats().gather_window != coordinator.gather_window()) {
    return fail("test_gather_window_adapts_within_bounds", "fast intents should shrink the coordinator window");
  }

  return 0;
}

int test_concurrent_requests_grant_exactly_k() {
  constexpr int kTriggers = 6;
  constexpr int kAgents = 4;

  for (std::size_t k : {std::size_t{1}, std::size_t{2}}) {
    TurnCoordinator coordinator(make_config(k, std::chrono::milliseconds(400)));
    std::latch ready(kTriggers * kAgents);
    std::vector<std::atomic<int>> grants(kTriggers);
    std::vector<std::atomic<bool>> top_granted(kTriggers);
    std::vector<std::thread> threads;

    for (int t = 0; t < kTriggers; ++t) {
      for (int a = 0; a < kAgents; ++a) {
        threads.emplace_back([&, t, a] {
          const std::string agent_id = "agent-" + std::to_string(a);
          const float confidence = 0.3F + 0.15F * static_cast<float>(a);
          ready.arrive_and_wait();
          if (coordinator.request_turn(agent_id, "trigger-" + std::to_string(t), confidence,
                                       std::chrono::seconds(5), {}, "room-" + std::to_string(t))) {
            grants[t].fetch_add(1);
            if (a == kAgents - 1) {
              top_granted[t] = true;
            }
          }
        });
      }
    }
    for (auto& thread : threads) {
      thread.join();
    }

    for (int t = 0; t < kTriggers; ++t) {
      if (grants[t].load() != static_cast<int>(k)) {
        return fail("test_concurrent_requests_grant_exactly_k", "each trigger must grant exactly K agents");
      }
      if (!top_granted[t].load()) {
        return fail("test_concurrent_requests_grant_exactly_k", "highest confidence agent must be among grants");
      }
      const auto decision = coordinator.decision("trigger-" + std::to_string(t));
      if (!decision.has_value() || decision->granted.size() + decision->denied.size() != static_cast<std::size_t>(kAgents)) {
        return fail("test_concurrent_requests_grant_exactly_k", "every participant must be granted or denied");
      }
    }
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_single_grant_and_late_caller_gets_cached_denial(); rc != 0) return rc;
  if (int rc = test_fan_out_grants_top_k(); rc != 0) return rc;
  if (int rc = test_duplicate_intent_is_idempotent(); rc != 0) return rc;
  if (int rc = test_recency_penalty_rotates_responders(); rc != 0) return rc;
  if (int rc = test_single_claimant_is_granted_regardless_of_confidence(); rc != 0) return rc;
  if (int rc = test_confidence_floor_and_quiet_room(); rc != 0) return rc;
  if (int rc = test_early_exit_needs_two_claimants(); rc != 0) return rc;
  if (int rc = test_request_turn_decides_at_gather_deadline(); rc != 0) return rc;
  if (int rc = test_timeout_withdraws_intent(); rc != 0) return rc;
  if (int rc = test_stop_token_and_shutdown_release_waiters(); rc != 0) return rc;
  if (int rc = test_sweep_retires_decided_contexts(); rc != 0) return rc;
  if (int rc = test_retired_trigger_denies_late_requests(); rc != 0) return rc;
  if (int rc = test_roster_deferrals_decide_early(); rc != 0) return rc;
  if (int rc = test_gather_window_adapts_within_bounds(); rc != 0) return rc;
  if (int rc = test_concurrent_requests_grant_exactly_k(); rc != 0) return rc;

  std::cout << "[PASS] coordinator unit tests\n";
  return 0;
}
