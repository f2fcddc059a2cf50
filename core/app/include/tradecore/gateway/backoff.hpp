#pragma once

#include <algorithm>
#include <chrono>

namespace tradecore {

// Capped exponential delay sequence: initial, initial*m, initial*m^2, ...
// never above max. reset() starts over.
class ExponentialBackoff {
 public:
  ExponentialBackoff(std::chrono::milliseconds initial,
                     std::chrono::milliseconds max, double multiplier)
      : initial_(initial),
        max_(std::max(initial, max)),
        multiplier_(multiplier < 1.0 ? 1.0 : multiplier),
        current_(initial) {}

  std::chrono::milliseconds next() {
    std::chrono::milliseconds delay = current_;
    auto grown = static_cast<std::chrono::milliseconds::rep>(
        static_cast<double>(current_.count()) * multiplier_);
    current_ = std::min(max_, std::chrono::milliseconds(grown));
    return delay;
  }

  void reset() { current_ = initial_; }

 private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds max_;
  double multiplier_;
  std::chrono::milliseconds current_;
};

}  // namespace tradecore
