#include "tradecore/strategy/strategy.hpp"

#include "tradecore/ledger/order_book.hpp"
#include "tradecore/ledger/order_state_machine.hpp"
#include "tradecore/risk/position_keeper.hpp"

#include <algorithm>
#include <utility>

namespace tradecore {

StrategyContext::StrategyContext(std::string strategy_id,
                                 std::vector<std::string> symbols,
                                 const OrderBook& book,
                                 const PositionKeeper& positions)
    : strategy_id_(std::move(strategy_id)),
      symbols_(std::move(symbols)),
      book_(book),
      positions_(positions) {}

std::vector<domain::Order> StrategyContext::orders() const {
  return book_.ordersForStrategy(strategy_id_);
}

std::vector<domain::Order> StrategyContext::workingOrders(
    const std::string& symbol) const {
  std::vector<domain::Order> result;
  if (!inScope(symbol)) {
    return result;
  }
  for (domain::Order& order : book_.ordersForStrategy(strategy_id_)) {
    if (order.symbol == symbol && OrderStateMachine::isWorking(order.state)) {
      result.push_back(std::move(order));
    }
  }
  return result;
}

domain::Position StrategyContext::position(const std::string& symbol) const {
  if (inScope(symbol)) {
    if (auto pos = positions_.position(symbol)) {
      return *pos;
    }
  }
  domain::Position flat;
  flat.symbol = symbol;
  return flat;
}

bool StrategyContext::inScope(const std::string& symbol) const {
  return std::find(symbols_.begin(), symbols_.end(), symbol) !=
         symbols_.end();
}

}  // namespace tradecore
