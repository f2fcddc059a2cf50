#pragma once

#include "tradecore/domain/market_snapshot.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tradecore {

// Wall-clock (or simulated) time carried on engine events.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketEvent: one normalized ticker update from the public feed
// -----------------------------------------------------------------------------
// Produced by FeedDecoder, consumed by MarketDataFeed on the market loop.
// sequence is the feed's per-symbol sequence number.
// -----------------------------------------------------------------------------
struct MarketEvent {
  std::string symbol;
  double bid{0.0};
  double ask{0.0};
  double last{0.0};
  std::uint64_t sequence{0};
  Timestamp timestamp{};
};

// Feed liveness signal. MarketDataFeed records the time of the last one.
struct HeartbeatEvent {
  std::string source;
  std::uint64_t sequence{0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// MarketSnapshotEvent: an accepted MarketEvent, after the sequence check
// -----------------------------------------------------------------------------
// Published by MarketDataFeed and bridged to the StrategyRunner. The
// snapshot is a copy; strategies never see the feed's internal map.
// -----------------------------------------------------------------------------
struct MarketSnapshotEvent {
  domain::MarketSnapshot snapshot;
};

}  // namespace tradecore
