#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tradecore {

// One entry of the "strategies" array in engine.json.
struct StrategyConfig {
  std::string id;
  std::string type;
  std::vector<std::string> symbols;  // scope: the only symbols it sees
  // Cap on |net position| per symbol, enforced at admission. Read from
  // options.max_position.
  std::optional<double> max_position;
  nlohmann::json options = nlohmann::json::object();
};

}  // namespace tradecore
