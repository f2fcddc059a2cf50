#include "tradecore/time/simulation_time_provider.hpp"

namespace tradecore {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  std::int64_t current = current_time_ms_.load();
  while (new_time_ms > current &&
         !current_time_ms_.compare_exchange_weak(current, new_time_ms)) {
  }
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace tradecore
