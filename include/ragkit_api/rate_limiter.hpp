#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ragkit_api {

/**
 * In-process sliding-window admission control, one window per "scope:key".
 * A rejected request is not counted.
 */
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  RateLimiter();
  explicit RateLimiter(ClockFn clock);

  // Throws ragkit_core::RateLimited when `key` already made `limit` requests in the window.
  void check(const std::string &scope, const std::string &key, int limit, int window_seconds);

  // Number of "scope:key" windows currently held.
  size_t tracked_keys();

  // Expired windows are dropped at most this often.
  static constexpr std::chrono::seconds SWEEP_INTERVAL{60};

 private:
  struct Window {
    std::deque<Clock::time_point> events;
    std::chrono::seconds length{0};
  };

  // Caller holds mutex_.
  void sweep_expired(Clock::time_point now);

  ClockFn clock_;
  std::mutex mutex_;
  std::unordered_map<std::string, Window> windows_;
  Clock::time_point last_sweep_{};
};

}  // namespace ragkit_api
