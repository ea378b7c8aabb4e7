#include "ragkit_api/rate_limiter.hpp"

#include "ragkit_core/errors.hpp"

namespace ragkit_api {

RateLimiter::RateLimiter() : RateLimiter([] { return Clock::now(); }) {}

RateLimiter::RateLimiter(ClockFn clock) : clock_(std::move(clock)) {
  last_sweep_ = clock_();
}

void RateLimiter::check(const std::string &scope, const std::string &key, int limit, int window_seconds) {
  const Clock::time_point now = clock_();
  const std::chrono::seconds length(window_seconds);

  std::lock_guard<std::mutex> lock(mutex_);
  if (now - last_sweep_ >= SWEEP_INTERVAL) {
    sweep_expired(now);
  }

  Window &window = windows_[scope + ":" + key];
  window.length = length;
  while (!window.events.empty() && window.events.front() < now - length) {
    window.events.pop_front();
  }
  if (static_cast<int>(window.events.size()) >= limit) {
    throw ragkit_core::RateLimited(scope);
  }
  window.events.push_back(now);
}

size_t RateLimiter::tracked_keys() {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

void RateLimiter::sweep_expired(Clock::time_point now) {
  // Keys come from client headers; a window with no live events is dropped.
  for (auto it = windows_.begin(); it != windows_.end();) {
    const auto &events = it->second.events;
    if (events.empty() || events.back() < now - it->second.length) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
  last_sweep_ = now;
}

}  // namespace ragkit_api
