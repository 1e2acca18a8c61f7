#include "orex/time/simulation_time_provider.hpp"

namespace orex {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_by(): fetch_add returns the previous value, so add delta again
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace orex
