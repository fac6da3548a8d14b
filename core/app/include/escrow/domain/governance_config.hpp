#pragma once

#include "escrow/domain/escrow.hpp"

#include <cstdint>

namespace escrow {
namespace domain {

// Upper bound on the protocol fee: 1000 bps = 10.00%.
inline constexpr std::uint32_t kMaxFeeBps = 1000;

// Basis-point denominator: 10000 bps = 100%.
inline constexpr std::uint32_t kBpsDenominator = 10000;

// -----------------------------------------------------------------------------
// GovernanceConfig — protocol fee parameters and the identity that owns them
// -----------------------------------------------------------------------------
//
// @brief  Value snapshot of the governance singleton.
//
// @details
// The authoritative copy lives inside escrow::Governance and is mutated only
// by its authorized operations. Every mutation bumps version, so a
// settlement that read version N can tell whether the rate and collector it
// is about to use are still current.
//
// version starts at 1 when governance is bootstrapped; 0 means "never
// initialized" and only appears in default-constructed snapshots.
// -----------------------------------------------------------------------------
struct GovernanceConfig {
  Identity authority;
  std::uint32_t fee_rate_bps{0};
  Identity fee_collector;
  std::uint64_t version{0};
};

// -----------------------------------------------------------------------------
// FeePolicy — which disbursements the protocol fee is charged on
// -----------------------------------------------------------------------------
//
//   PayoffOnly        Fee is taken from the ITM payoff paid to the holder.
//                     Residual collateral and OTM returns go back to the
//                     initializer untouched.
//
//   AllDisbursements  Fee is also taken from whatever returns to the
//                     initializer (ITM residual or the full OTM return).
//
// Selected in EngineConfig. The fee rate and collector still come from
// GovernanceConfig.
// -----------------------------------------------------------------------------
enum class FeePolicy {
  PayoffOnly,
  AllDisbursements,
};

inline const char* toString(FeePolicy policy) {
  switch (policy) {
    case FeePolicy::PayoffOnly:       return "payoff_only";
    case FeePolicy::AllDisbursements: return "all_disbursements";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace escrow
