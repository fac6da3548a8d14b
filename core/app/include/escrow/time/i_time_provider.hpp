#pragma once

#include "escrow/domain/escrow.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// ITimeProvider — the caller's external clock
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface for "what time is it now", injected into
//         the command layer instead of a direct std::chrono call.
//
// @details
// Every time-dependent escrow rule (expiration, European settle window,
// American early exercise, expire_escrow) compares against a `now` that
// the caller supplies. The EscrowRegistry never reads a clock: its
// operations take `now` as an argument. Only the EscrowEngine consults an
// ITimeProvider, and only when a command omits "now".
//
//   - LiveTimeProvider        → std::chrono::system_clock.
//   - SimulationTimeProvider  → a value the test or simulation sets.
//
// The engine receives `const ITimeProvider&` and does not know which one
// it was given, so a test can walk an escrow across its expiration
// without sleeping.
//
// Why int64 milliseconds (domain::TimestampMs) instead of a time_point:
//   - The command protocol carries "now" and "expiration_time" as JSON
//     integers; the clock returns the same unit.
//   - Expiration comparisons are plain integer comparisons in the domain.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from any thread.
//   Writers (SimulationTimeProvider::advance_time) synchronize with readers
//   internally.
//
// Ownership:
//   The engine holds a const reference and does not own the provider. The
//   provider must outlive the engine.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in milliseconds since the Unix epoch.
  //
  // @return domain::TimestampMs  Epoch milliseconds. A simulation clock
  //         returns whatever it was last set to.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual domain::TimestampMs now_ms() const = 0;
};

}  // namespace escrow
