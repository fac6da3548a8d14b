#pragma once

#include "escrow/domain/escrow.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// Outcome
// -----------------------------------------------------------------------------
// InTheMoney:    holder receives the (clamped) payoff, less fee.
// OutOfTheMoney: holder receives nothing; collateral returns to the writer.
// Spot exactly at strike is always OutOfTheMoney.
// -----------------------------------------------------------------------------
enum class Outcome {
  InTheMoney,
  OutOfTheMoney,
};

inline const char* toString(Outcome outcome) {
  switch (outcome) {
    case Outcome::InTheMoney:    return "ITM";
    case Outcome::OutOfTheMoney: return "OTM";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Leg — one release out of an escrow's custody
// -----------------------------------------------------------------------------
// Payoff through ReturnFee are the legs of a settlement, in release order.
// OriginationFee is released at deposit time. The numeric values are part of the vault idempotency key
// (escrow_id, leg) and must never be renumbered.
// -----------------------------------------------------------------------------
enum class Leg : std::uint32_t {
  Payoff = 1,          // holder's payoff net of fee
  PayoffFee = 2,       // fee on the payoff, to the fee collector
  Return = 3,          // residual / OTM return to the initializer
  ReturnFee = 4,       // fee on the return (AllDisbursements policy only)
  OriginationFee = 5,  // fee taken out of a deposit, to the fee collector
};

inline const char* toString(Leg leg) {
  switch (leg) {
    case Leg::Payoff:         return "payoff";
    case Leg::PayoffFee:      return "payoff_fee";
    case Leg::Return:         return "return";
    case Leg::ReturnFee:      return "return_fee";
    case Leg::OriginationFee: return "origination_fee";
  }
  return "unknown";
}

// One vault release.
struct Release {
  Leg leg{Leg::Payoff};
  Identity recipient;
  Amount amount{0};
};

// -----------------------------------------------------------------------------
// DisbursementPlan
// -----------------------------------------------------------------------------
//
// @brief  The complete, already-decided distribution of an escrow's
//         collateral: outcome, payoff, fees, and the ordered release legs.
//
// @details
// Built by SettlementEngine::planDisbursement() from one governance
// snapshot. Zero-amount legs are omitted from `releases`.
//
// Conservation: payoff + returned == collateral, and the sum of all
// release amounts == collateral.
//
// Once the first release has been attempted the plan is binding: if the
// vault fails part-way, the registry keeps the plan and replays it
// verbatim on the next attempt instead of recomputing it from a new spot
// price or a new fee rate.
// -----------------------------------------------------------------------------
struct DisbursementPlan {
  EscrowId escrow_id{0};
  Outcome outcome{Outcome::OutOfTheMoney};
  bool early_exercise{false};
  Price spot_price{0};
  Amount collateral{0};
  Amount payoff{0};        // gross, before fee
  Amount payoff_fee{0};
  Amount returned{0};      // gross residual to the initializer, before fee
  Amount return_fee{0};
  std::optional<Identity> holder;
  Identity fee_collector;
  std::uint32_t fee_rate_bps{0};
  std::uint64_t governance_version{0};
  std::vector<Release> releases;

  Amount holderNet() const { return payoff - payoff_fee; }
  Amount initializerNet() const { return returned - return_fee; }
  Amount totalFee() const { return payoff_fee + return_fee; }
};

}  // namespace domain
}  // namespace escrow
