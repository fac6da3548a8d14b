#pragma once

#include "escrow/error/escrow_error.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// Checked unsigned 64-bit arithmetic
// -----------------------------------------------------------------------------
//
// @brief  Monetary arithmetic that never wraps.
//
// @details
// Two flavours:
//
//   tryMul / tryAdd / trySub   return std::nullopt when the exact result
//                              does not fit in uint64_t. Used where the
//                              caller can resolve an out-of-range value
//                              exactly (the payoff clamp).
//
//   checkedMul / checkedAdd / checkedSub
//                              throw EscrowError(ArithmeticOverflow). The
//                              `what` argument names the quantity being
//                              computed so the log line is useful.
//
// The overflow tests are done before the operation, so no intermediate
// value is ever wrapped.
//
// Thread-safety: Stateless — safe to call from any thread.
// -----------------------------------------------------------------------------

inline std::optional<std::uint64_t> tryMul(std::uint64_t a, std::uint64_t b) {
  if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a) {
    return std::nullopt;
  }
  return a * b;
}

inline std::optional<std::uint64_t> tryAdd(std::uint64_t a, std::uint64_t b) {
  if (b > std::numeric_limits<std::uint64_t>::max() - a) {
    return std::nullopt;
  }
  return a + b;
}

inline std::optional<std::uint64_t> trySub(std::uint64_t a, std::uint64_t b) {
  if (b > a) {
    return std::nullopt;
  }
  return a - b;
}

inline std::uint64_t checkedMul(std::uint64_t a, std::uint64_t b,
                                const char* what) {
  auto r = tryMul(a, b);
  if (!r) {
    throw EscrowError(ErrorCode::ArithmeticOverflow,
                      std::string("overflow computing ") + what);
  }
  return *r;
}

inline std::uint64_t checkedAdd(std::uint64_t a, std::uint64_t b,
                                const char* what) {
  auto r = tryAdd(a, b);
  if (!r) {
    throw EscrowError(ErrorCode::ArithmeticOverflow,
                      std::string("overflow computing ") + what);
  }
  return *r;
}

inline std::uint64_t checkedSub(std::uint64_t a, std::uint64_t b,
                                const char* what) {
  auto r = trySub(a, b);
  if (!r) {
    throw EscrowError(ErrorCode::ArithmeticOverflow,
                      std::string("underflow computing ") + what);
  }
  return *r;
}

}  // namespace escrow
