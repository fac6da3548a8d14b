#pragma once

#include "escrow/domain/governance_config.hpp"

#include <cstdint>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// GovernanceUpdateEvent
// -----------------------------------------------------------------------------
// Published by Governance after each successful mutation. `change` names the
// operation ("fee_rate", "fee_collector", "governance", "authority").
// -----------------------------------------------------------------------------
struct GovernanceUpdateEvent {
  domain::GovernanceConfig config;
  std::string change;
  std::uint64_t sequence_id{0};
};

}  // namespace escrow
