#pragma once

#include <stdexcept>

namespace tradecore {

// Invalid configuration: bad engine.json values, unknown strategy type or
// option. Thrown at startup only.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace tradecore
