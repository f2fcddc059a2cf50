#include "tradecore/gateway/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace tradecore {

RateLimiter::RateLimiter(int tokens, std::chrono::milliseconds interval)
    : capacity_(static_cast<double>(tokens)),
      tokens_per_ms_(tokens > 0 && interval.count() > 0
                         ? static_cast<double>(tokens) /
                               static_cast<double>(interval.count())
                         : 0.0),
      tokens_(static_cast<double>(tokens)),
      last_refill_(Clock::now()) {}

void RateLimiter::refill(Clock::time_point now) {
  auto elapsed_ms = std::chrono::duration<double, std::milli>(
                        now - last_refill_).count();
  if (elapsed_ms <= 0.0) {
    return;
  }
  tokens_ = std::min(capacity_, tokens_ + elapsed_ms * tokens_per_ms_);
  last_refill_ = now;
}

bool RateLimiter::tryAcquire() {
  if (capacity_ <= 0.0) {
    return true;
  }
  std::lock_guard lock(mutex_);
  refill(Clock::now());
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return true;
  }
  return false;
}

// -----------------------------------------------------------------------------
// acquire: wait for the next token instead of failing
// -----------------------------------------------------------------------------
void RateLimiter::acquire() {
  if (capacity_ <= 0.0) {
    return;
  }

  bool waited = false;
  for (;;) {
    std::chrono::microseconds wait{0};
    {
      std::lock_guard lock(mutex_);
      refill(Clock::now());
      if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        break;
      }
      double missing = 1.0 - tokens_;
      wait = std::chrono::microseconds(
          static_cast<std::int64_t>(std::ceil(missing / tokens_per_ms_ * 1000.0)));
    }
    if (!waited) {
      throttled_.fetch_add(1, std::memory_order_relaxed);
      waited = true;
    }
    std::this_thread::sleep_for(std::max(wait, std::chrono::microseconds(100)));
  }
}

double RateLimiter::available() {
  if (capacity_ <= 0.0) {
    return 0.0;
  }
  std::lock_guard lock(mutex_);
  refill(Clock::now());
  return tokens_;
}

}  // namespace tradecore
