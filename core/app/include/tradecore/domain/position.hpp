#pragma once

#include <string>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// Position: net exposure per symbol, derived only from applied fills
// -----------------------------------------------------------------------------
//
// Sign convention for net_quantity: positive = long, negative = short.
//
// average_price is the weighted entry price of the open exposure. It moves on
// fills that grow the position, stays put on fills that shrink it, and resets
// to the fill price when a fill flips the sign.
//
// realized_pnl accumulates closed_qty * (fill_price - average_price) for
// longs and closed_qty * (average_price - fill_price) for shorts.
//
// Ownership:
//   PositionKeeper owns the mutable copy; everything else sees snapshots.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double net_quantity{0.0};
  double average_price{0.0};
  double realized_pnl{0.0};
};

}  // namespace domain
}  // namespace tradecore
