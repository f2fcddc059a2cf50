#pragma once

#include "tradecore/strategy/strategy.hpp"
#include "tradecore/strategy/strategy_config.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// QuotingStrategy: symmetric two-sided quoting around the mid
// -----------------------------------------------------------------------------
//
// @brief  Keeps at most one working limit order per side per symbol, priced
//         at mid -/+ spread/2, and re-quotes when the mid moves away.
//
// @details
// Options (engine.json "options"; anything else is a ConfigError):
//   order_size    quantity of each quote                 (default 1.0)
//   max_position  no new quote on a side that could push
//                 |position| above this                  (default 10.0)
//   spread        full bid/ask distance in price units   (default 1.0)
//
// On each snapshot, per side:
//   - no working order: place one if the position allows it.
//   - working order priced more than spread/2 away from the new target:
//     cancel it; the replacement is placed on a later snapshot once the
//     cancel has gone through.
// Fills need no action; the next snapshot re-evaluates.
// -----------------------------------------------------------------------------
class QuotingStrategy : public IStrategy {
 public:
  explicit QuotingStrategy(const StrategyConfig& config);

  const std::string& id() const override { return id_; }

  std::vector<domain::Intent> on_market_update(
      const domain::MarketSnapshot& snapshot,
      const StrategyContext& context) override;

  std::vector<domain::Intent> on_fill(const domain::Fill& fill,
                                      const StrategyContext& context) override;

  void on_intent_result(const IntentResult& result) override;

  double orderSize() const { return order_size_; }
  double maxPosition() const { return max_position_; }
  double spread() const { return spread_; }

  std::uint64_t deniedCount() const { return denied_; }

 private:
  void quoteSide(const domain::MarketSnapshot& snapshot, double mid,
                 domain::Side side, const std::vector<domain::Order>& working,
                 double position, std::vector<domain::Intent>& out);

  std::string id_;
  double order_size_{1.0};
  double max_position_{10.0};
  double spread_{1.0};

  std::unordered_set<domain::ClientOrderId> cancel_requested_;
  std::uint64_t denied_{0};
};

}  // namespace tradecore
