#pragma once

#include "tradecore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradecore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
// Starts at 0 (or the given start) and moves only when told to. In
// simulation mode the FeedGateway advances it to each message's timestamp;
// tests advance it directly.
//
// Thread model: atomic; readers and the single writer need no extra locking.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Jump to an absolute time. Earlier values are ignored so time never runs
  // backwards when feed messages arrive slightly out of order.
  void advance_time(std::int64_t new_time_ms);

  // Move forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradecore
