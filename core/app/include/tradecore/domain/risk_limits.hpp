#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// SymbolLimits: admission thresholds for one symbol
// -----------------------------------------------------------------------------
struct SymbolLimits {
  /// Maximum number of non-terminal orders (Pending, Open, PartiallyFilled,
  /// Unknown) resting for the symbol, across all strategies.
  std::size_t max_open_orders{10};

  /// Maximum absolute net position after the new order, counting the
  /// remaining quantity of every working order on the same side.
  double max_net_position{1000.0};

  /// Maximum price * quantity of a single order.
  double max_order_notional{1000000.0};
};

// -----------------------------------------------------------------------------
// RiskLimits: engine-wide defaults plus per-symbol overrides
// -----------------------------------------------------------------------------
//
// @brief  Loaded from the "risk" section of the engine configuration and
//         copied into the AdmissionController at construction.
//
// @details
// A symbol listed in per_symbol uses that entry in full; every other symbol
// uses defaults. Overrides are not merged field by field at this level (the
// config loader fills unspecified override fields from the defaults).
//
// Thread model:
//   Plain value type. Immutable once the engine is running.
// -----------------------------------------------------------------------------
struct RiskLimits {
  SymbolLimits defaults;
  std::unordered_map<std::string, SymbolLimits> per_symbol;

  const SymbolLimits& forSymbol(const std::string& symbol) const {
    auto it = per_symbol.find(symbol);
    return it != per_symbol.end() ? it->second : defaults;
  }
};

}  // namespace domain
}  // namespace tradecore
