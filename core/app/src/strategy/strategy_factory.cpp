#include "tradecore/strategy/strategy_factory.hpp"

#include "tradecore/config/config_error.hpp"
#include "tradecore/strategy/quoting_strategy.hpp"

#include <utility>

namespace tradecore {

StrategyFactory::StrategyFactory() {
  registerType("quoting", [](const StrategyConfig& config) {
    return std::make_unique<QuotingStrategy>(config);
  });
}

void StrategyFactory::registerType(const std::string& type, Creator creator) {
  creators_[type] = std::move(creator);
}

std::unique_ptr<IStrategy> StrategyFactory::create(
    const StrategyConfig& config) const {
  if (config.id.empty()) {
    throw ConfigError("strategy without an id");
  }
  if (config.symbols.empty()) {
    throw ConfigError("strategy '" + config.id + "' has no symbols");
  }
  auto it = creators_.find(config.type);
  if (it == creators_.end()) {
    throw ConfigError("strategy '" + config.id + "': unknown type '" +
                      config.type + "'");
  }
  return it->second(config);
}

std::vector<std::string> StrategyFactory::types() const {
  std::vector<std::string> names;
  for (const auto& [type, creator] : creators_) {
    names.push_back(type);
  }
  return names;
}

}  // namespace tradecore
