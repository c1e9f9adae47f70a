#include "state/rate_limiter.hpp"

#include <algorithm>

namespace turnwise::state {

RateLimiter::RateLimiter(core::RateLimitConfig config) : config_(config) {}

bool RateLimiter::is_rate_limited(const std::string& context_id, const Clock::time_point now) const {
  const auto count_it = response_count_.find(context_id);
  if (count_it != response_count_.end() && count_it->second >= config_.max_responses_per_session) {
    return true;
  }

  const auto last_it = last_response_time_.find(context_id);
  if (last_it == last_response_time_.end()) {
    return false;
  }
  return now - last_it->second < config_.min_between_responses;
}

void RateLimiter::record_response(const std::string& context_id, const Clock::time_point now) {
  last_response_time_[context_id] = now;
  ++response_count_[context_id];
}

void RateLimiter::reset(const std::string& context_id) {
  last_response_time_.erase(context_id);
  response_count_.erase(context_id);
}

void RateLimiter::reset_all() {
  last_response_time_.clear();
  response_count_.clear();
}

model::RateLimitInfo RateLimiter::rate_limit_info(const std::string& context_id, const Clock::time_point now) const {
  model::RateLimitInfo info{};
  info.context_id = context_id;
  if (const auto it = last_response_time_.find(context_id); it != last_response_time_.end()) {
    info.last_response = it->second;
  }
  if (const auto it = response_count_.find(context_id); it != response_count_.end()) {
    info.response_count = it->second;
  }
  info.limited = is_rate_limited(context_id, now);
  return info;
}

std::vector<model::RateLimitInfo> RateLimiter::all_rate_limit_info(const Clock::time_point now) const {
  std::vector<model::RateLimitInfo> infos;
  infos.reserve(response_count_.size());
  for (const auto& [context_id, _] : response_count_) {
    infos.push_back(rate_limit_info(context_id, now));
  }
  std::sort(infos.begin(), infos.end(),
            [](const model::RateLimitInfo& lhs, const model::RateLimitInfo& rhs) { return lhs.context_id < rhs.context_id; });
  return infos;
}

}  // namespace turnwise::state
