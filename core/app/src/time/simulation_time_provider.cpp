#include "escrow/time/simulation_time_provider.hpp"

namespace escrow {

domain::TimestampMs SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(domain::TimestampMs new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

}  // namespace escrow
