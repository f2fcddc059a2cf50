#include "tradecore/ledger/order_state_machine.hpp"

#include "tradecore/domain/to_string.hpp"

namespace tradecore {

bool OrderStateMachine::canTransition(domain::OrderState from,
                                      domain::OrderState to) {
  using S = domain::OrderState;

  switch (from) {
    case S::Pending:
      return to == S::Open ||
             to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Rejected ||
             to == S::Unknown;

    case S::Open:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Unknown;

    case S::PartiallyFilled:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Unknown;

    case S::Unknown:
      return to == S::Open ||
             to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Rejected;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
      return false;
  }

  return false;
}

bool OrderStateMachine::isTerminal(domain::OrderState state) {
  using S = domain::OrderState;
  return state == S::Filled ||
         state == S::Cancelled ||
         state == S::Rejected;
}

const char* OrderStateMachine::toString(domain::OrderState state) {
  return domain::toString(state);
}

}  // namespace tradecore
