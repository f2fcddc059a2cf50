#include "tradecore/strategy/quoting_strategy.hpp"

#include "tradecore/config/config_error.hpp"
#include "tradecore/domain/to_string.hpp"
#include "tradecore/ledger/order_state_machine.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <iostream>

namespace tradecore {

namespace {

double positiveOption(const StrategyConfig& config, const std::string& key,
                      const nlohmann::json& value) {
  if (!value.is_number()) {
    throw ConfigError("strategy '" + config.id + "': option '" + key +
                      "' must be a number");
  }
  double v = value.get<double>();
  if (!(v > 0.0)) {
    throw ConfigError("strategy '" + config.id + "': option '" + key +
                      "' must be positive");
  }
  return v;
}

}  // namespace

QuotingStrategy::QuotingStrategy(const StrategyConfig& config)
    : id_(config.id) {
  if (!config.options.is_object()) {
    throw ConfigError("strategy '" + config.id +
                      "': options must be an object");
  }
  for (const auto& [key, value] : config.options.items()) {
    if (key == "order_size") {
      order_size_ = positiveOption(config, key, value);
    } else if (key == "max_position") {
      max_position_ = positiveOption(config, key, value);
    } else if (key == "spread") {
      spread_ = positiveOption(config, key, value);
    } else {
      throw ConfigError("strategy '" + config.id + "': unknown option '" +
                        key + "' for type quoting");
    }
  }
}

std::vector<domain::Intent> QuotingStrategy::on_market_update(
    const domain::MarketSnapshot& snapshot, const StrategyContext& context) {
  std::vector<domain::Intent> intents;
  std::optional<double> mid = domain::referencePrice(snapshot);
  if (!mid) {
    return intents;
  }

  // Forget cancels whose order has left the working set.
  std::vector<domain::Order> own = context.orders();
  for (auto it = cancel_requested_.begin(); it != cancel_requested_.end();) {
    bool working_still = std::any_of(
        own.begin(), own.end(), [&it](const domain::Order& order) {
          return order.client_order_id == *it &&
                 OrderStateMachine::isWorking(order.state);
        });
    it = working_still ? std::next(it) : cancel_requested_.erase(it);
  }

  std::vector<domain::Order> working = context.workingOrders(snapshot.symbol);
  double position = context.position(snapshot.symbol).net_quantity;

  quoteSide(snapshot, *mid, domain::Side::Buy, working, position, intents);
  quoteSide(snapshot, *mid, domain::Side::Sell, working, position, intents);
  return intents;
}

void QuotingStrategy::quoteSide(const domain::MarketSnapshot& snapshot,
                                double mid, domain::Side side,
                                const std::vector<domain::Order>& working,
                                double position,
                                std::vector<domain::Intent>& out) {
  double half = spread_ / 2.0;
  double target = side == domain::Side::Buy ? mid - half : mid + half;

  for (const domain::Order& order : working) {
    if (order.side != side) {
      continue;
    }
    // One working order on this side already.
    if (order.state == domain::OrderState::Pending ||
        order.state == domain::OrderState::Unknown ||
        cancel_requested_.count(order.client_order_id) > 0) {
      return;
    }
    if (order.price && std::abs(*order.price - target) > half) {
      cancel_requested_.insert(order.client_order_id);
      out.emplace_back(domain::CancelOrder{order.client_order_id});
    }
    return;
  }

  double projected = side == domain::Side::Buy ? position + order_size_
                                               : position - order_size_;
  if (std::abs(projected) > max_position_ + domain::kQuantityEpsilon) {
    return;
  }

  domain::PlaceOrder place;
  place.symbol = snapshot.symbol;
  place.side = side;
  place.type = domain::OrderType::Limit;
  place.price = target;
  place.quantity = order_size_;
  out.emplace_back(std::move(place));
}

std::vector<domain::Intent> QuotingStrategy::on_fill(
    const domain::Fill& fill, const StrategyContext& context) {
  std::cout << "[QuotingStrategy] " << id_ << " filled " << fill.quantity
            << " @ " << fill.price << " on " << fill.order_id
            << " (" << context.orders().size() << " orders on record)\n";
  return {};
}

void QuotingStrategy::on_intent_result(const IntentResult& result) {
  if (result.decision.allowed) {
    return;
  }
  ++denied_;
  if (const auto* cancel = std::get_if<domain::CancelOrder>(&result.intent)) {
    cancel_requested_.erase(cancel->client_order_id);
  }
}

}  // namespace tradecore
