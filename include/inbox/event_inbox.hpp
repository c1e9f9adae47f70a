#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <vector>

#include "model/event.hpp"

namespace turnwise::inbox {

enum class enqueue_result : std::uint8_t {
  QUEUED = 0,
  QUEUED_WITH_EVICTION = 1,
  DROPPED = 2,
  CLOSED = 3,
};

struct InboxCounters {
  std::uint64_t enqueued{0};
  std::uint64_t dropped{0};
  std::uint64_t evicted{0};
  std::uint64_t expired{0};
};

// Bounded priority queue owned by a single agent. Enqueue may come from any
// thread; ordering is priority descending, then arrival ascending.
class EventInbox {
 public:
  using Clock = model::Clock;

  explicit EventInbox(std::size_t capacity = 1000);

  EventInbox(const EventInbox&) = delete;
  EventInbox& operator=(const EventInbox&) = delete;

  enqueue_result enqueue(model::Event event, Clock::time_point arrival = Clock::now());

  [[nodiscard]] std::vector<model::InboxEntry> peek(std::size_t n) const;

  // Blocks until an entry arrives, the timeout elapses, stop is requested or
  // the inbox is closed.
  std::optional<model::InboxEntry> pop(std::chrono::milliseconds timeout, std::stop_token stop = {});

  // Removes one specific entry previously returned by peek().
  std::optional<model::InboxEntry> take(const model::InboxEntry& entry);

  std::size_t expire_older_than(std::chrono::steady_clock::duration max_age, Clock::time_point now = Clock::now());

  void close();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] bool closed() const;
  [[nodiscard]] InboxCounters counters() const;

 private:
  struct Order {
    bool operator()(const model::InboxEntry& lhs, const model::InboxEntry& rhs) const noexcept;
  };

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable_any not_empty_;
  std::set<model::InboxEntry, Order> entries_;
  std::uint64_t next_sequence_{0};
  InboxCounters counters_{};
  bool closed_{false};
};

const char* enqueue_result_name(enqueue_result result) noexcept;

}  // namespace turnwise::inbox
