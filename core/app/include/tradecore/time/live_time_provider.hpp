#pragma once

#include "tradecore/time/i_time_provider.hpp"

#include <chrono>

namespace tradecore {

// Wall clock for live trading. Exchange timestamps and the audit window are
// both epoch based, so this is system_clock rather than steady_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override {
    return timestamp_to_ms(std::chrono::system_clock::now());
  }
};

}  // namespace tradecore
