#include "escrow/time/live_time_provider.hpp"

#include <chrono>

namespace escrow {

domain::TimestampMs LiveTimeProvider::now_ms() const {
  auto now = std::chrono::system_clock::now();
  auto duration = now.time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}

}  // namespace escrow
