#include "tradecore/risk/position_keeper.hpp"

#include <cmath>
#include <mutex>

namespace tradecore {

domain::Position PositionKeeper::applyFill(const std::string& symbol,
                                           domain::Side side, double quantity,
                                           double price) {
  double signed_quantity =
      (side == domain::Side::Buy) ? quantity : -quantity;

  std::unique_lock lock(mutex_);
  domain::Position& pos = positions_[symbol];
  if (pos.symbol.empty()) {
    pos.symbol = symbol;
  }
  applySignedFill(pos, signed_quantity, price);
  return pos;
}

std::optional<domain::Position> PositionKeeper::position(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

double PositionKeeper::netQuantity(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  return it != positions_.end() ? it->second.net_quantity : 0.0;
}

std::vector<domain::Position> PositionKeeper::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

void PositionKeeper::hydrate(const domain::Position& position) {
  std::unique_lock lock(mutex_);
  positions_[position.symbol] = position;
}

// -----------------------------------------------------------------------------
// applySignedFill: weighted entry, realized PnL on reduction, reset on flip
// -----------------------------------------------------------------------------
void PositionKeeper::applySignedFill(domain::Position& pos,
                                     double signed_quantity, double price) {
  double current = pos.net_quantity;

  if (std::abs(current) <= domain::kQuantityEpsilon) {
    pos.net_quantity = signed_quantity;
    pos.average_price = price;
    return;
  }

  bool same_direction = (current > 0.0) == (signed_quantity > 0.0);
  if (same_direction) {
    double total = current + signed_quantity;
    pos.average_price =
        (current * pos.average_price + signed_quantity * price) / total;
    pos.net_quantity = total;
    return;
  }

  double abs_current = std::abs(current);
  double abs_fill = std::abs(signed_quantity);
  double direction = (current > 0.0) ? 1.0 : -1.0;

  if (abs_fill <= abs_current + domain::kQuantityEpsilon) {
    pos.realized_pnl += abs_fill * (price - pos.average_price) * direction;
    pos.net_quantity = current + signed_quantity;
    if (std::abs(pos.net_quantity) <= domain::kQuantityEpsilon) {
      pos.net_quantity = 0.0;
    }
    return;
  }

  // Reversal: close everything, open the rest at the fill price.
  pos.realized_pnl += abs_current * (price - pos.average_price) * direction;
  pos.net_quantity = -direction * (abs_fill - abs_current);
  pos.average_price = price;
}

}  // namespace tradecore
