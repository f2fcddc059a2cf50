#pragma once

#include "tradecore/config/config_error.hpp"
#include "tradecore/domain/risk_limits.hpp"
#include "tradecore/gateway/exchange_gateway.hpp"
#include "tradecore/strategy/strategy_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tradecore {

enum class EngineMode {
  Simulation,
  Live,
};

// Network surfaces. An empty endpoint disables that surface.
struct EndpointConfig {
  std::string market_data{"tcp://127.0.0.1:5555"};
  std::string exchange{"tcp://127.0.0.1:5558"};
  std::string ipc_command{"tcp://127.0.0.1:5556"};
  std::string ipc_telemetry{"tcp://127.0.0.1:5557"};
};

struct RateLimitConfig {
  int tokens{10};
  std::chrono::milliseconds interval{1000};
};

// -----------------------------------------------------------------------------
// EngineConfig: everything engine.json can set
// -----------------------------------------------------------------------------
// Every field has a default, so "{}" is a valid (simulation) configuration.
// -----------------------------------------------------------------------------
struct EngineConfig {
  EngineMode mode{EngineMode::Simulation};
  std::string session_prefix{"tc"};
  EndpointConfig endpoints;
  GatewaySettings gateway;
  std::chrono::milliseconds request_timeout{2000};
  RateLimitConfig rate_limit;
  std::size_t routing_workers{4};
  domain::RiskLimits risk;
  std::int64_t audit_retention_ms{3600000};
  std::vector<StrategyConfig> strategies;
};

// -----------------------------------------------------------------------------
// parseEngineConfig(json) / loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @brief  Builds an EngineConfig. Missing keys keep their defaults.
//
// @throws ConfigError for an unreadable file, malformed JSON, a wrong type,
//         an unknown mode, a non-positive limit or count, or a strategy
//         entry without id/type/symbols.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& j);
EngineConfig loadEngineConfig(const std::string& path);

const char* toString(EngineMode mode);

}  // namespace tradecore
