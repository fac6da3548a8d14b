#pragma once

#include "disbursement_pending_event.hpp"
#include "escrow_update_event.hpp"
#include "governance_update_event.hpp"
#include "settlement_event.hpp"

#include <variant>

namespace escrow {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for everything the engine
// publishes. One EventBus carries every kind; subscribers use the typed
// EventBus::subscribe<T>() or std::get_if to pick what they need.
//
// Adding a kind means adding it here and to IpcServer::formatTelemetry().
// -----------------------------------------------------------------------------
using Event = std::variant<
    EscrowUpdateEvent,
    SettlementEvent,
    GovernanceUpdateEvent,
    DisbursementPendingEvent>;

}  // namespace escrow
