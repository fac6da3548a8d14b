#pragma once

#include "escrow/time/i_time_provider.hpp"

#include <atomic>

namespace escrow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly rather than read from
//         the system clock.
//
// @details
// Starts at `start_ms` and moves only when advance_time() is called. A test
// creates an escrow expiring at 5000 with the clock at 1000, deposits,
// advances to 5000, and settles, all without waiting on the wall clock.
// The same sequence of calls always produces the same expiration
// decisions.
//
// Internal storage:
//   std::atomic<domain::TimestampMs> current_time_ms_
//
// Why std::atomic instead of a mutex:
//   The clock is a single value. Command threads read it while a test or
//   simulation driver writes it; an atomic load or store gives the
//   visibility needed without serializing readers.
//
// Thread model:
//   - advance_time() is meant for a single driver thread, but is safe from
//     any thread.
//   - now_ms() may be called concurrently from every command thread.
//
// Ownership:
//   Created by the test or the simulation harness and passed by reference
//   to the EscrowEngine.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  start_ms  Initial clock value in epoch milliseconds.
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(domain::TimestampMs start_ms = 0)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last value set by the constructor or advance_time().
  //
  // Thread-safety: Any thread. Atomic load (seq_cst).
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  domain::TimestampMs now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to new_time_ms.
  //
  // @param  new_time_ms  Epoch milliseconds. Moving backwards is allowed so
  //                      a test can replay a window; the registry guards
  //                      its own time rules against the value it is given.
  //
  // Thread-safety: Any thread. Atomic store (seq_cst); every later now_ms()
  //                sees the new value.
  // Side-effects:  Changes what now_ms() returns for every reader.
  // -------------------------------------------------------------------------
  void advance_time(domain::TimestampMs new_time_ms);

 private:
  std::atomic<domain::TimestampMs> current_time_ms_;
};

}  // namespace escrow
