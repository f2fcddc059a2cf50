#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tradecore {
namespace domain {

// One resting order in a level-3 book snapshot.
struct BookEntry {
  std::string order_id;
  double price{0.0};
  double size{0.0};
};

// -----------------------------------------------------------------------------
// BookSnapshot: full level-3 order book of one symbol at a feed sequence
// -----------------------------------------------------------------------------
// Fetched from the exchange when a MarketOrderBook has no state yet or has
// lost messages. Every incremental message with a sequence at or below
// `sequence` is already reflected in it.
// -----------------------------------------------------------------------------
struct BookSnapshot {
  std::string symbol;
  std::uint64_t sequence{0};
  std::vector<BookEntry> bids;
  std::vector<BookEntry> asks;
};

}  // namespace domain
}  // namespace tradecore
