#include "inbox/event_inbox.hpp"

#include <iterator>
#include <utility>

#include "core/log.hpp"
#include "core/math.hpp"

namespace turnwise::inbox {

bool EventInbox::Order::operator()(const model::InboxEntry& lhs, const model::InboxEntry& rhs) const noexcept {
  if (lhs.event.priority != rhs.event.priority) {
    return lhs.event.priority > rhs.event.priority;
  }
  if (lhs.arrival != rhs.arrival) {
    return lhs.arrival < rhs.arrival;
  }
  return lhs.sequence < rhs.sequence;
}

EventInbox::EventInbox(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

enqueue_result EventInbox::enqueue(model::Event event, const Clock::time_point arrival) {
  event.priority = core::clamp01(event.priority);

  enqueue_result result = enqueue_result::QUEUED;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return enqueue_result::CLOSED;
    }

    if (entries_.size() >= capacity_) {
      const auto lowest = std::prev(entries_.end());
      if (event.priority <= lowest->event.priority) {
        ++counters_.dropped;
        core::log(core::log_level::DEBUG, "inbox", "full (", capacity_, "); dropped event ", event.id,
                  " priority=", event.priority);
        return enqueue_result::DROPPED;
      }
      core::log(core::log_level::DEBUG, "inbox", "full (", capacity_, "); evicted event ", lowest->event.id,
                " priority=", lowest->event.priority);
      entries_.erase(lowest);
      ++counters_.evicted;
      result = enqueue_result::QUEUED_WITH_EVICTION;
    }

    entries_.insert(model::InboxEntry{std::move(event), arrival, next_sequence_++});
    ++counters_.enqueued;
  }

  not_empty_.notify_one();
  return result;
}

std::vector<model::InboxEntry> EventInbox::peek(const std::size_t n) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::InboxEntry> top;
  top.reserve(n < entries_.size() ? n : entries_.size());
  for (auto it = entries_.begin(); it != entries_.end() && top.size() < n; ++it) {
    top.push_back(*it);
  }
  return top;
}

std::optional<model::InboxEntry> EventInbox::pop(const std::chrono::milliseconds timeout, std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready = not_empty_.wait_for(lock, stop, timeout, [this] { return !entries_.empty() || closed_; });
  if (!ready || entries_.empty()) {
    return std::nullopt;
  }

  auto node = entries_.extract(entries_.begin());
  return std::move(node.value());
}

std::optional<model::InboxEntry> EventInbox::take(const model::InboxEntry& entry) {
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(entry);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  auto node = entries_.extract(it);
  return std::move(node.value());
}

std::size_t EventInbox::expire_older_than(const std::chrono::steady_clock::duration max_age,
                                          const Clock::time_point now) {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->arrival > max_age) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  counters_.expired += removed;
  return removed;
}

void EventInbox::close() {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
}

std::size_t EventInbox::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool EventInbox::closed() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

InboxCounters EventInbox::counters() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return counters_;
}

const char* enqueue_result_name(const enqueue_result result) noexcept {
  switch (result) {
    case enqueue_result::QUEUED:
      return "queued";
    case enqueue_result::QUEUED_WITH_EVICTION:
      return "queued_with_eviction";
    case enqueue_result::DROPPED:
      return "dropped";
    case enqueue_result::CLOSED:
      return "closed";
  }
  return "unknown";
}

}  // namespace turnwise::inbox
