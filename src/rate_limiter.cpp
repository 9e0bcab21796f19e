#include "mcpws/rate_limiter.hpp"

namespace mcpws {

void RateLimiter::prune(TimePoint now) {
  while (!starts_.empty() && starts_.front() + config_.window <= now) {
    starts_.pop_front();
  }
}

bool RateLimiter::try_acquire(TimePoint now) {
  if (!config_.enabled) {
    return true;
  }
  if (is_blocked(now)) {
    return false;
  }
  prune(now);
  if (starts_.size() >= config_.max_requests) {
    blocked_until_ = now + config_.retry_after;
    return false;
  }
  blocked_until_.reset();
  starts_.push_back(now);
  return true;
}

size_t RateLimiter::in_window(TimePoint now) {
  prune(now);
  return starts_.size();
}

void RateLimiter::reset() {
  starts_.clear();
  blocked_until_.reset();
}

}  // namespace mcpws
