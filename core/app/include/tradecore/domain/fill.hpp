#pragma once

#include "tradecore/domain/order.hpp"

#include <cstdint>
#include <string>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// Fill: one execution against an order
// -----------------------------------------------------------------------------
// exchange_fill_id is the dedup key: the ledger applies a given id at most
// once no matter how many times the exchange (or a status replay) reports it.
// timestamp is epoch milliseconds as reported by the exchange.
// -----------------------------------------------------------------------------
struct Fill {
  ClientOrderId order_id;
  std::string exchange_fill_id;
  double quantity{0.0};
  double price{0.0};
  std::int64_t timestamp{0};
};

}  // namespace domain
}  // namespace tradecore
