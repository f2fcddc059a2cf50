#include "tradecore/config/engine_config.hpp"

#include <fstream>

namespace tradecore {

namespace {

template <typename T>
T positive(const nlohmann::json& j, const char* key, T fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  T value = j.at(key).get<T>();
  if (!(value > T{})) {
    throw ConfigError(std::string("'") + key + "' must be positive");
  }
  return value;
}

domain::SymbolLimits parseLimits(const nlohmann::json& j,
                                 const domain::SymbolLimits& base) {
  domain::SymbolLimits limits = base;
  if (j.contains("max_open_orders_per_symbol")) {
    int count = j.at("max_open_orders_per_symbol").get<int>();
    if (count <= 0) {
      throw ConfigError("'max_open_orders_per_symbol' must be positive");
    }
    limits.max_open_orders = static_cast<std::size_t>(count);
  }
  limits.max_net_position =
      positive(j, "max_net_position", limits.max_net_position);
  limits.max_order_notional =
      positive(j, "max_order_notional", limits.max_order_notional);
  return limits;
}

StrategyConfig parseStrategy(const nlohmann::json& j) {
  StrategyConfig config;
  if (!j.contains("id") || !j.contains("type") || !j.contains("symbols")) {
    throw ConfigError("strategy entries need 'id', 'type' and 'symbols'");
  }
  config.id = j.at("id").get<std::string>();
  config.type = j.at("type").get<std::string>();
  config.symbols = j.at("symbols").get<std::vector<std::string>>();
  if (config.id.empty() || config.symbols.empty()) {
    throw ConfigError("strategy '" + config.id +
                      "' needs a non-empty id and symbol list");
  }
  if (j.contains("options")) {
    config.options = j.at("options");
    if (!config.options.is_object()) {
      throw ConfigError("strategy '" + config.id +
                        "': 'options' must be an object");
    }
    auto cap = config.options.find("max_position");
    if (cap != config.options.end()) {
      if (!cap->is_number() || !(cap->get<double>() > 0.0)) {
        throw ConfigError("strategy '" + config.id +
                          "': 'max_position' must be a positive number");
      }
      config.max_position = cap->get<double>();
    }
  }
  return config;
}

}  // namespace

const char* toString(EngineMode mode) {
  return mode == EngineMode::Live ? "live" : "simulation";
}

EngineConfig parseEngineConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  EngineConfig config;
  try {
    if (j.contains("mode")) {
      const std::string mode = j.at("mode").get<std::string>();
      if (mode == "simulation") {
        config.mode = EngineMode::Simulation;
      } else if (mode == "live") {
        config.mode = EngineMode::Live;
      } else {
        throw ConfigError("unknown mode '" + mode + "'");
      }
    }

    config.session_prefix = j.value("session_prefix", config.session_prefix);
    if (config.session_prefix.empty()) {
      throw ConfigError("'session_prefix' must not be empty");
    }

    if (j.contains("endpoints")) {
      const auto& e = j.at("endpoints");
      EndpointConfig& ep = config.endpoints;
      ep.market_data = e.value("market_data", ep.market_data);
      ep.exchange = e.value("exchange", ep.exchange);
      ep.ipc_command = e.value("ipc_command", ep.ipc_command);
      ep.ipc_telemetry = e.value("ipc_telemetry", ep.ipc_telemetry);
    }

    if (j.contains("gateway")) {
      const auto& g = j.at("gateway");
      GatewaySettings& gw = config.gateway;
      gw.max_attempts = positive(g, "max_attempts", gw.max_attempts);
      gw.initial_backoff = std::chrono::milliseconds(positive(
          g, "initial_backoff_ms",
          static_cast<std::int64_t>(gw.initial_backoff.count())));
      gw.max_backoff = std::chrono::milliseconds(
          positive(g, "max_backoff_ms",
                   static_cast<std::int64_t>(gw.max_backoff.count())));
      gw.backoff_multiplier =
          g.value("backoff_multiplier", gw.backoff_multiplier);
      if (gw.backoff_multiplier < 1.0) {
        throw ConfigError("'backoff_multiplier' must be at least 1");
      }
      config.request_timeout = std::chrono::milliseconds(positive(
          g, "request_timeout_ms",
          static_cast<std::int64_t>(config.request_timeout.count())));
      if (g.contains("rate_limit")) {
        const auto& r = g.at("rate_limit");
        config.rate_limit.tokens =
            positive(r, "tokens", config.rate_limit.tokens);
        config.rate_limit.interval = std::chrono::milliseconds(positive(
            r, "interval_ms",
            static_cast<std::int64_t>(config.rate_limit.interval.count())));
      }
    }

    if (j.contains("routing_workers")) {
      int workers = j.at("routing_workers").get<int>();
      if (workers <= 0) {
        throw ConfigError("'routing_workers' must be positive");
      }
      config.routing_workers = static_cast<std::size_t>(workers);
    }

    if (j.contains("risk")) {
      const auto& r = j.at("risk");
      config.risk.defaults = parseLimits(r, config.risk.defaults);
      if (r.contains("symbols")) {
        for (const auto& [symbol, overrides] : r.at("symbols").items()) {
          config.risk.per_symbol[symbol] =
              parseLimits(overrides, config.risk.defaults);
        }
      }
    }

    config.audit_retention_ms =
        positive(j, "audit_retention_ms", config.audit_retention_ms);

    if (j.contains("strategies")) {
      for (const auto& s : j.at("strategies")) {
        config.strategies.push_back(parseStrategy(s));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file " + path);
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }
  return parseEngineConfig(j);
}

}  // namespace tradecore
