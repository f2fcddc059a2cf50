#pragma once

#include "tradecore/strategy/strategy.hpp"
#include "tradecore/strategy/strategy_config.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// StrategyFactory: builds strategies from configuration records
// -----------------------------------------------------------------------------
// "quoting" is registered by default. registerType() adds more at startup.
// create() throws ConfigError for an unknown type, an empty id or symbol
// list, or options the strategy does not recognize.
// -----------------------------------------------------------------------------
class StrategyFactory {
 public:
  using Creator =
      std::function<std::unique_ptr<IStrategy>(const StrategyConfig&)>;

  StrategyFactory();

  void registerType(const std::string& type, Creator creator);

  std::unique_ptr<IStrategy> create(const StrategyConfig& config) const;

  std::vector<std::string> types() const;

 private:
  std::map<std::string, Creator> creators_;
};

}  // namespace tradecore
