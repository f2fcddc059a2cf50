#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// MarketSnapshot: latest known top of book and last trade for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Owned by MarketDataFeed. Each accepted update replaces the previous
//         snapshot for the symbol as a whole; fields are never merged.
//
// @details
// sequence is the feed's monotonic sequence number for the symbol; updates
// at or below the current sequence are stale and discarded. A zero price
// means "not provided by the feed".
//
// timestamp is epoch milliseconds.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string symbol;
  double bid{0.0};
  double ask{0.0};
  double last{0.0};
  std::uint64_t sequence{0};
  std::int64_t timestamp{0};
};

// Mid of bid/ask when both sides are present, else the last trade.
inline std::optional<double> referencePrice(const MarketSnapshot& snapshot) {
  if (snapshot.bid > 0.0 && snapshot.ask > 0.0) {
    return (snapshot.bid + snapshot.ask) / 2.0;
  }
  if (snapshot.last > 0.0) {
    return snapshot.last;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace tradecore
