#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace tradecore {

// -----------------------------------------------------------------------------
// RateLimiter: token bucket in front of every exchange request
// -----------------------------------------------------------------------------
//
// @brief  At most `tokens` requests per `interval`, with bursts up to
//         `tokens`. Refill is continuous (tokens / interval per unit time).
//
// @details
// acquire() never drops a request: when the bucket is empty the caller
// sleeps until the next token is due, then tries again. The wait happens
// outside the lock so other callers can compute their own wait meanwhile.
// Every acquire() that had to wait is counted in throttledCount().
//
// tokens <= 0 disables limiting.
//
// Thread model: safe from any thread.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(int tokens, std::chrono::milliseconds interval);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Blocks until a token is available, then takes it.
  void acquire();

  // Takes a token if one is available right now.
  bool tryAcquire();

  double available();

  std::uint64_t throttledCount() const {
    return throttled_.load(std::memory_order_relaxed);
  }

 private:
  // Caller holds mutex_.
  void refill(Clock::time_point now);

  const double capacity_;
  const double tokens_per_ms_;

  std::mutex mutex_;
  double tokens_;
  Clock::time_point last_refill_;

  std::atomic<std::uint64_t> throttled_{0};
};

}  // namespace tradecore
