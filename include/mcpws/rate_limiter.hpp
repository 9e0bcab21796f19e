#ifndef MCPWS_RATE_LIMITER_HPP_
#define MCPWS_RATE_LIMITER_HPP_

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace mcpws {

struct RateLimitConfig {
  bool enabled = true;
  uint32_t max_requests = 30;
  std::chrono::milliseconds window{60000};
  std::chrono::milliseconds retry_after{5000};
};

/**
 * @brief Sliding-window limiter over request start times.
 *
 * When the window is full the limiter blocks for retry_after; attempts
 * before blocked_until fail without inspecting the window.
 */
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig()) : config_(config) {}

  // Records a start at now if admitted.
  bool try_acquire(TimePoint now);

  bool is_blocked(TimePoint now) const { return blocked_until_ && now < *blocked_until_; }
  const std::optional<TimePoint>& blocked_until() const { return blocked_until_; }

  size_t in_window(TimePoint now);
  void reset();

  const RateLimitConfig& config() const { return config_; }

 private:
  void prune(TimePoint now);

  RateLimitConfig config_;
  std::deque<TimePoint> starts_;
  std::optional<TimePoint> blocked_until_;
};

}  // namespace mcpws

#endif  // MCPWS_RATE_LIMITER_HPP_
