#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/position.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// PositionKeeper: per-symbol net position and realized PnL
// -----------------------------------------------------------------------------
//
// @brief  Holds one Position per symbol, moved only by applied fills.
//
// @details
// applyFill() is called by the ReconciliationEngine right after the
// OrderBook accepted a fill, so a duplicate fill can never move a position.
// Strategies and admission only read.
//
// Fill math on a signed quantity (Buy +, Sell -):
//
//   Flat:               qty = fill, avg = price.
//   Same direction:     avg = (qty * avg + fill * price) / (qty + fill),
//                       qty += fill.
//   Opposite, no cross: realized += |fill| * (price - avg) * sign(qty),
//                       qty += fill, avg unchanged.
//   Crossing zero:      close |qty| as above, then open the remainder in
//                       the new direction at avg = price.
//
// Thread model:
//   shared_mutex. applyFill/hydrate take a unique lock; readers take a
//   shared lock and may run on any thread (admission runs on strategy
//   workers, IPC on its own thread).
// -----------------------------------------------------------------------------
class PositionKeeper {
 public:
  PositionKeeper() = default;

  PositionKeeper(const PositionKeeper&) = delete;
  PositionKeeper& operator=(const PositionKeeper&) = delete;
  PositionKeeper(PositionKeeper&&) = delete;
  PositionKeeper& operator=(PositionKeeper&&) = delete;

  // Applies one fill and returns the updated position snapshot.
  domain::Position applyFill(const std::string& symbol, domain::Side side,
                             double quantity, double price);

  std::optional<domain::Position> position(const std::string& symbol) const;

  // Net quantity, 0 when the symbol was never traded.
  double netQuantity(const std::string& symbol) const;

  std::vector<domain::Position> snapshots() const;

  // Startup only: seeds a position reported by the exchange.
  void hydrate(const domain::Position& position);

  // The math above, on a caller-owned Position.
  static void applySignedFill(domain::Position& position,
                              double signed_quantity, double price);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
};

}  // namespace tradecore
