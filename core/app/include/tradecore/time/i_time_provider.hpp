#pragma once

#include "tradecore/time/time_utils.hpp"

#include <cstdint>

namespace tradecore {

// -----------------------------------------------------------------------------
// ITimeProvider: injected clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every component that stamps or ages state:
//         ledger timestamps, audit-window eviction, event timestamps.
//
// @details
// Nothing in the engine reads std::chrono clocks directly. Live runs inject
// LiveTimeProvider; tests and simulation inject SimulationTimeProvider and
// move time explicitly, which keeps eviction and timestamps deterministic.
// The ledger works in epoch milliseconds; now() is the same instant as the
// Timestamp carried on events.
//
// Thread model:
//   Implementations must make now_ms() safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;

  Timestamp now() const { return ms_to_timestamp(now_ms()); }
};

}  // namespace tradecore
