#pragma once

#include "escrow/time/i_time_provider.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the escrowd daemon, where a command without "now" is judged
// against the actual time. Converts system_clock::now() to milliseconds
// since the Unix epoch.
//
// Why a class instead of calling chrono in the engine:
//   The engine depends only on ITimeProvider, so tests substitute a
//   SimulationTimeProvider without touching engine code.
//
// Thread model:
//   system_clock::now() is safe from any thread. No shared mutable state.
//
// Ownership:
//   Created in main() and passed by const reference to the EscrowEngine.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Current wall-clock time in milliseconds since epoch.
  //
  // Thread-safety: Any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  domain::TimestampMs now_ms() const override;
};

}  // namespace escrow
