#pragma once

#include "escrow/domain/escrow_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// Scalar aliases
// -----------------------------------------------------------------------------
// EscrowId   — unique escrow identifier, assigned by the registry from a
//              monotonic generator. 0 is reserved as "unset".
// Identity   — verified caller identity (account key). Signature checking is
//              done upstream; the engine only compares identities.
// Amount     — token quantity in the collateral asset's smallest unit.
// Price      — fixed-point price of the underlying per unit of notional.
// TimestampMs — epoch milliseconds. The engine never reads a clock; every
//              time value is supplied by the caller.
//
// All monetary values are unsigned 64-bit integers. Arithmetic on them goes
// through escrow/arith/checked_math.hpp; floating point is never used.
// -----------------------------------------------------------------------------
using EscrowId = std::uint64_t;
using Identity = std::string;
using Amount = std::uint64_t;
using Price = std::uint64_t;
using TimestampMs = std::int64_t;

// -----------------------------------------------------------------------------
// OptionType / ExerciseStyle
// -----------------------------------------------------------------------------
enum class OptionType {
  Call,  // Holder profits when spot rises above strike
  Put,   // Holder profits when spot falls below strike
};

enum class ExerciseStyle {
  American,  // Early exercise allowed before expiration
  European,  // Settlement only at or after expiration
};

inline const char* toString(OptionType type) {
  switch (type) {
    case OptionType::Call: return "Call";
    case OptionType::Put:  return "Put";
  }
  return "Unknown";
}

inline const char* toString(ExerciseStyle style) {
  switch (style) {
    case ExerciseStyle::American: return "American";
    case ExerciseStyle::European: return "European";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Escrow
// -----------------------------------------------------------------------------
//
// @brief  Full state of one option contract held in escrow: the terms set
//         at creation, the locked collateral, and the lifecycle status.
//
// @details
// Terms (option_type, style, strike_price, notional, expiration_time,
// collateral_asset, max_collateral) are immutable after creation. Only the
// EscrowRegistry mutates status, collateral_amount, counterparty,
// lock_receipt and settled_at, and only while holding the escrow's lock.
//
// Collateral invariant:
//   collateral_amount > 0   while status is Collateralized or Exercised
//   collateral_amount == 0  in Created, Settled and Cancelled
//
// origination_fee is fixed at creation when the registry charges one: the
// governance fee rate of that moment applied to the required collateral.
// It is paid to origination_fee_collector out of the deposit, on top of
// collateral_amount. 0 when no origination fee applies.
//
// max_collateral is the writer's explicit payoff cap. A Call has unbounded
// upside, so the writer must state how much collateral backs it; a Put may
// omit it (its worst case is strike * notional).
//
// Copies handed out by the registry and carried in events are snapshots.
// -----------------------------------------------------------------------------
struct Escrow {
  EscrowId id{0};
  Identity initializer;                  // Option writer, funds the escrow
  std::optional<Identity> counterparty;  // Option holder, may be unset
  OptionType option_type{OptionType::Call};
  ExerciseStyle style{ExerciseStyle::European};
  Price strike_price{0};
  Amount notional{0};
  TimestampMs expiration_time{0};
  std::string collateral_asset;
  Amount collateral_amount{0};
  std::optional<Amount> max_collateral;
  EscrowStatus status{EscrowStatus::Created};
  TimestampMs created_at{0};
  std::optional<std::string> lock_receipt;  // Vault receipt from deposit
  std::optional<TimestampMs> settled_at;
  Amount origination_fee{0};
  std::optional<Identity> origination_fee_collector;
};

}  // namespace domain
}  // namespace escrow
