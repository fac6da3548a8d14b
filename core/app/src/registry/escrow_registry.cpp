#include "escrow/registry/escrow_registry.hpp"
#include "escrow/arith/checked_math.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/events/disbursement_pending_event.hpp"
#include "escrow/events/escrow_update_event.hpp"
#include "escrow/events/settlement_event.hpp"
#include "escrow/settlement/fee_calculator.hpp"
#include "escrow/settlement/settlement_engine.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace escrow {

namespace {

std::string escrowLabel(domain::EscrowId id) {
  return "escrow " + std::to_string(id);
}

void requireAlive(const domain::Escrow& escrow) {
  if (domain::isTerminal(escrow.status)) {
    throw EscrowError(ErrorCode::AlreadySettled,
                      escrowLabel(escrow.id) + " is already " +
                          domain::toString(escrow.status));
  }
}

void requireStatus(const domain::Escrow& escrow,
                   domain::EscrowStatus expected) {
  if (escrow.status != expected) {
    throw EscrowError(ErrorCode::InvalidState,
                      escrowLabel(escrow.id) + " is " +
                          domain::toString(escrow.status) + ", expected " +
                          domain::toString(expected));
  }
}

void requireInitializer(const domain::Escrow& escrow,
                        const domain::Identity& caller, const char* operation) {
  if (caller != escrow.initializer) {
    throw EscrowError(ErrorCode::Unauthorized,
                      std::string(operation) + ": caller '" + caller +
                          "' is not the initializer of " +
                          escrowLabel(escrow.id));
  }
}

// A pending disbursement may be pushed along by either party it concerns.
void requireReplayCaller(const domain::Escrow& escrow,
                         const domain::DisbursementPlan& plan,
                         const domain::Identity& caller) {
  if (caller == escrow.initializer || (plan.holder && caller == *plan.holder)) {
    return;
  }
  throw EscrowError(ErrorCode::Unauthorized,
                    "caller '" + caller + "' is not a party to the pending "
                    "disbursement of " + escrowLabel(escrow.id));
}

void requireParameter(bool ok, const char* message) {
  if (!ok) {
    throw EscrowError(ErrorCode::InvalidParameters, message);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EscrowRegistry::EscrowRegistry(EventBus& bus, Governance& governance,
                               ICollateralVault& vault,
                               domain::FeePolicy fee_policy,
                               bool origination_fee)
    : bus_(bus),
      governance_(governance),
      vault_(vault),
      fee_policy_(fee_policy),
      origination_fee_(origination_fee) {}

// -----------------------------------------------------------------------------
// isLegalTransition: the lifecycle graph
// -----------------------------------------------------------------------------
bool EscrowRegistry::isLegalTransition(domain::EscrowStatus from,
                                       domain::EscrowStatus to) {
  using S = domain::EscrowStatus;

  switch (from) {
    case S::Created:
      return to == S::Collateralized ||
             to == S::Cancelled;

    case S::Collateralized:
      return to == S::Exercised ||
             to == S::Settled;

    case S::Exercised:
      return to == S::Settled ||
             to == S::Collateralized;

    case S::Settled:
    case S::Cancelled:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// initializeEscrow
// -----------------------------------------------------------------------------
domain::EscrowId EscrowRegistry::initializeEscrow(
    const domain::Identity& caller, const InitializeEscrowParams& params) {
  requireParameter(!caller.empty(), "initializer must not be empty");
  requireParameter(params.strike_price > 0, "strike_price must be positive");
  requireParameter(params.notional > 0, "notional must be positive");
  requireParameter(params.expiration_time > params.now,
                   "expiration_time must be in the future");
  requireParameter(!params.collateral_asset.empty(),
                   "collateral_asset must not be empty");
  if (params.counterparty) {
    requireParameter(!params.counterparty->empty(),
                     "counterparty must not be empty when given");
    requireParameter(*params.counterparty != caller,
                     "counterparty must differ from the initializer");
  }

  // Validates the collateral rule for the option type up front.
  const domain::Amount required = SettlementEngine::requiredCollateral(
      params.option_type, params.strike_price, params.notional,
      params.max_collateral);

  auto entry = std::make_unique<Entry>();
  domain::Escrow& escrow = entry->escrow;
  escrow.id = id_generator_.next_id();
  escrow.initializer = caller;
  escrow.counterparty = params.counterparty;
  escrow.option_type = params.option_type;
  escrow.style = params.style;
  escrow.strike_price = params.strike_price;
  escrow.notional = params.notional;
  escrow.expiration_time = params.expiration_time;
  escrow.collateral_asset = params.collateral_asset;
  escrow.max_collateral = params.max_collateral;
  escrow.status = domain::EscrowStatus::Created;
  escrow.created_at = params.now;

  if (origination_fee_) {
    const domain::GovernanceConfig config = governance_.snapshot();
    escrow.origination_fee =
        FeeCalculator::computeFee(required, config.fee_rate_bps);
    if (escrow.origination_fee > 0) {
      escrow.origination_fee_collector = config.fee_collector;
    }
  }

  const domain::Escrow created = escrow;

  // Sequenced before the entry is visible, so no later update of this
  // escrow can carry a lower sequence number.
  Outbox outbox;
  emitUpdate(created, domain::EscrowStatus::Created, params.now, outbox);
  {
    std::unique_lock lock(map_mutex_);
    entries_.emplace(created.id, std::move(entry));
  }

  std::cout << "[EscrowRegistry] " << escrowLabel(created.id) << " created by "
            << caller << ": " << domain::toString(created.style) << ' '
            << domain::toString(created.option_type) << " strike="
            << created.strike_price << " notional=" << created.notional
            << " requires " << required << ' ' << created.collateral_asset;
  if (created.origination_fee > 0) {
    std::cout << " plus origination fee " << created.origination_fee;
  }
  std::cout << '\n';

  flush(outbox);
  return created.id;
}

// -----------------------------------------------------------------------------
// depositCollateral
// -----------------------------------------------------------------------------
void EscrowRegistry::depositCollateral(const domain::Identity& caller,
                                       domain::EscrowId escrow_id,
                                       const std::string& asset,
                                       domain::Amount amount,
                                       domain::TimestampMs now) {
  Entry& entry = findEntry(escrow_id);
  Outbox outbox;
  {
    std::lock_guard lock(entry.mutex);
    domain::Escrow& escrow = entry.escrow;

    requireInitializer(escrow, caller, "deposit_collateral");
    requireStatus(escrow, domain::EscrowStatus::Created);

    if (asset != escrow.collateral_asset) {
      throw EscrowError(ErrorCode::IncorrectCollateralAsset,
                        escrowLabel(escrow_id) + " is collateralized in " +
                            escrow.collateral_asset + ", not " + asset);
    }

    const domain::Amount required = SettlementEngine::requiredCollateral(escrow);
    if (amount < required) {
      throw EscrowError(ErrorCode::InsufficientCollateral,
                        "deposit of " + std::to_string(amount) +
                            " is below the required " +
                            std::to_string(required));
    }

    // Commit point. A throw here leaves the escrow as it was. The
    // origination fee is locked together with the collateral and paid out
    // of custody straight away; if that release fails the escrow stays
    // Created with the funds in custody, and a retry of the same deposit
    // finds the same lock and finishes the fee leg.
    const domain::Amount total = checkedAdd(amount, escrow.origination_fee,
                                            "deposit plus origination fee");
    const VaultReceipt receipt =
        vault_.lock(escrow_id, caller, escrow.collateral_asset, total);
    if (escrow.origination_fee > 0) {
      try {
        vault_.release(escrow_id, domain::Leg::OriginationFee,
                       *escrow.origination_fee_collector,
                       escrow.collateral_asset, escrow.origination_fee);
      } catch (const EscrowError& e) {
        std::cerr << "[EscrowRegistry] ERROR: " << escrowLabel(escrow_id)
                  << " origination fee release failed: " << e.what()
                  << ". Deposit not committed.\n";
        throw;
      }
    }

    transition(escrow, domain::EscrowStatus::Collateralized);
    escrow.collateral_amount = amount;
    escrow.lock_receipt = receipt.receipt_id;

    std::cout << "[EscrowRegistry] " << escrowLabel(escrow_id) << " locked "
              << amount << ' ' << asset << " (receipt " << receipt.receipt_id
              << ")\n";

    emitUpdate(escrow, domain::EscrowStatus::Created, now, outbox);
  }
  flush(outbox);
}

// -----------------------------------------------------------------------------
// assignCounterparty
// -----------------------------------------------------------------------------
void EscrowRegistry::assignCounterparty(const domain::Identity& caller,
                                        domain::EscrowId escrow_id,
                                        const domain::Identity& holder,
                                        domain::TimestampMs now) {
  Entry& entry = findEntry(escrow_id);
  Outbox outbox;
  {
    std::lock_guard lock(entry.mutex);
    domain::Escrow& escrow = entry.escrow;

    requireInitializer(escrow, caller, "assign_counterparty");
    requireAlive(escrow);
    if (escrow.counterparty || entry.pending) {
      throw EscrowError(ErrorCode::InvalidState,
                        escrowLabel(escrow_id) + " already has a holder");
    }
    requireParameter(!holder.empty(), "holder must not be empty");
    requireParameter(holder != escrow.initializer,
                     "holder must differ from the initializer");

    escrow.counterparty = holder;
    emitUpdate(escrow, escrow.status, now, outbox);
  }
  flush(outbox);
}

// -----------------------------------------------------------------------------
// exerciseEarly
// -----------------------------------------------------------------------------
domain::DisbursementPlan EscrowRegistry::exerciseEarly(
    const domain::Identity& caller, domain::EscrowId escrow_id,
    domain::Price spot_price, domain::TimestampMs now) {
  Entry& entry = findEntry(escrow_id);
  Outbox outbox;
  domain::DisbursementPlan plan;
  std::optional<ReleaseFailure> failure;
  {
    std::lock_guard lock(entry.mutex);
    const domain::Escrow& escrow = entry.escrow;

    requireAlive(escrow);
    requireStatus(escrow, domain::EscrowStatus::Collateralized);

    if (entry.pending) {
      requireReplayCaller(escrow, *entry.pending, caller);
      plan = *entry.pending;
      failure = replayPending(entry, now, outbox);
    } else {
      if (escrow.style != domain::ExerciseStyle::American) {
        throw EscrowError(ErrorCode::NotAmerican,
                          escrowLabel(escrow_id) +
                              " is European and cannot be exercised early");
      }
      if (now >= escrow.expiration_time) {
        throw EscrowError(ErrorCode::Expired,
                          escrowLabel(escrow_id) + " expired at " +
                              std::to_string(escrow.expiration_time));
      }
      if (caller == escrow.initializer ||
          (escrow.counterparty && caller != *escrow.counterparty)) {
        throw EscrowError(ErrorCode::Unauthorized,
                          "exercise_early: caller '" + caller +
                              "' is not the holder of " +
                              escrowLabel(escrow_id));
      }
      if (!SettlementEngine::isInTheMoney(escrow.option_type,
                                          escrow.strike_price, spot_price)) {
        throw EscrowError(ErrorCode::NotITM,
                          escrowLabel(escrow_id) + " is not in the money at " +
                              std::to_string(spot_price));
      }

      plan = planAgainstCurrentGovernance(escrow, spot_price, caller, true);
      failure = executePlan(entry, plan, now, outbox);
    }
  }
  return finish(plan, failure, outbox);
}

// -----------------------------------------------------------------------------
// settleEscrow
// -----------------------------------------------------------------------------
domain::DisbursementPlan EscrowRegistry::settleEscrow(
    const domain::Identity& caller, domain::EscrowId escrow_id,
    domain::Price spot_price, domain::TimestampMs now) {
  Entry& entry = findEntry(escrow_id);
  Outbox outbox;
  domain::DisbursementPlan plan;
  std::optional<ReleaseFailure> failure;
  {
    std::lock_guard lock(entry.mutex);
    const domain::Escrow& escrow = entry.escrow;

    requireAlive(escrow);
    requireStatus(escrow, domain::EscrowStatus::Collateralized);

    if (entry.pending) {
      requireReplayCaller(escrow, *entry.pending, caller);
      plan = *entry.pending;
      failure = replayPending(entry, now, outbox);
    } else {
      if (now < escrow.expiration_time) {
        throw EscrowError(ErrorCode::NotExpired,
                          escrowLabel(escrow_id) + " expires at " +
                              std::to_string(escrow.expiration_time));
      }

      std::optional<domain::Identity> holder;
      if (caller == escrow.initializer) {
        holder = escrow.counterparty;
      } else if (escrow.counterparty) {
        if (caller != *escrow.counterparty) {
          throw EscrowError(ErrorCode::Unauthorized,
                            "settle_escrow: caller '" + caller +
                                "' is not a party to " +
                                escrowLabel(escrow_id));
        }
        holder = escrow.counterparty;
      } else {
        holder = caller;
      }

      plan = planAgainstCurrentGovernance(escrow, spot_price, holder, false);
      failure = executePlan(entry, plan, now, outbox);
    }
  }
  return finish(plan, failure, outbox);
}

// -----------------------------------------------------------------------------
// cancelEscrow
// -----------------------------------------------------------------------------
void EscrowRegistry::cancelEscrow(const domain::Identity& caller,
                                  domain::EscrowId escrow_id,
                                  domain::TimestampMs now) {
  Entry& entry = findEntry(escrow_id);
  Outbox outbox;
  {
    std::lock_guard lock(entry.mutex);
    domain::Escrow& escrow = entry.escrow;

    requireInitializer(escrow, caller, "cancel_escrow");
    requireAlive(escrow);
    requireStatus(escrow, domain::EscrowStatus::Created);

    // A deposit interrupted before its fee leg leaves funds in custody.
    const domain::Amount stranded = vault_.lockedBalance(escrow_id);
    if (stranded > 0) {
      vault_.release(escrow_id, domain::Leg::Return, escrow.initializer,
                     escrow.collateral_asset, stranded);
      std::cout << "[EscrowRegistry] " << escrowLabel(escrow_id)
                << " returned " << stranded << ' ' << escrow.collateral_asset
                << " left in custody by an unfinished deposit\n";
    }

    transition(escrow, domain::EscrowStatus::Cancelled);
    std::cout << "[EscrowRegistry] " << escrowLabel(escrow_id)
              << " cancelled by " << caller << '\n';
    emitUpdate(escrow, domain::EscrowStatus::Created, now, outbox);
  }
  flush(outbox);
}

// -----------------------------------------------------------------------------
// reconcilePending: retry every interrupted disbursement
// -----------------------------------------------------------------------------
std::size_t EscrowRegistry::reconcilePending(domain::TimestampMs now) {
  std::vector<Entry*> candidates;
  {
    std::shared_lock lock(map_mutex_);
    candidates.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      candidates.push_back(entry.get());
    }
  }

  std::size_t settled = 0;
  for (Entry* entry : candidates) {
    Outbox outbox;
    std::optional<ReleaseFailure> failure;
    domain::EscrowId id = 0;
    {
      std::lock_guard lock(entry->mutex);
      if (!entry->pending) {
        continue;
      }
      id = entry->escrow.id;
      failure = replayPending(*entry, now, outbox);
    }
    flush(outbox);

    if (failure) {
      std::cerr << "[EscrowRegistry] WARNING: " << escrowLabel(id)
                << " still pending at leg " << domain::toString(failure->leg)
                << ": " << failure->reason << '\n';
    } else {
      ++settled;
    }
  }

  std::cout << "[EscrowRegistry] reconcile settled " << settled
            << " pending disbursement(s)\n";
  return settled;
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
domain::Escrow EscrowRegistry::getEscrow(domain::EscrowId escrow_id) const {
  const Entry& entry = findEntry(escrow_id);
  std::lock_guard lock(entry.mutex);
  return entry.escrow;
}

std::vector<domain::Escrow> EscrowRegistry::snapshots() const {
  std::vector<domain::Escrow> out;
  std::shared_lock lock(map_mutex_);
  out.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    std::lock_guard entry_lock(entry->mutex);
    out.push_back(entry->escrow);
  }
  return out;
}

std::optional<domain::DisbursementPlan> EscrowRegistry::pendingDisbursement(
    domain::EscrowId escrow_id) const {
  const Entry& entry = findEntry(escrow_id);
  std::lock_guard lock(entry.mutex);
  return entry.pending;
}

std::size_t EscrowRegistry::pendingCount() const {
  std::size_t count = 0;
  std::shared_lock lock(map_mutex_);
  for (const auto& [id, entry] : entries_) {
    std::lock_guard entry_lock(entry->mutex);
    if (entry->pending) {
      ++count;
    }
  }
  return count;
}

std::size_t EscrowRegistry::size() const {
  std::shared_lock lock(map_mutex_);
  return entries_.size();
}

// -----------------------------------------------------------------------------
// hydrateEscrow: warm-up from persisted state
// -----------------------------------------------------------------------------
void EscrowRegistry::hydrateEscrow(const domain::Escrow& escrow) {
  requireParameter(escrow.id != 0, "persisted escrow has id 0");
  requireParameter(escrow.status != domain::EscrowStatus::Exercised,
                   "persisted escrow is in the transient Exercised status");

  auto entry = std::make_unique<Entry>();
  entry->escrow = escrow;
  {
    std::unique_lock lock(map_mutex_);
    if (!entries_.emplace(escrow.id, std::move(entry)).second) {
      throw EscrowError(ErrorCode::InvalidParameters,
                        "persisted " + escrowLabel(escrow.id) +
                            " is already in the book");
    }
  }
  id_generator_.advancePast(escrow.id);
}

// -----------------------------------------------------------------------------
// hydratePending: warm-up of an interrupted disbursement
// -----------------------------------------------------------------------------
void EscrowRegistry::hydratePending(const domain::DisbursementPlan& plan) {
  Entry* entry = nullptr;
  {
    std::shared_lock lock(map_mutex_);
    auto it = entries_.find(plan.escrow_id);
    requireParameter(it != entries_.end(),
                     "persisted pending disbursement names an unknown escrow");
    entry = it->second.get();
  }

  std::lock_guard lock(entry->mutex);
  domain::Escrow& escrow = entry->escrow;
  requireParameter(escrow.status == domain::EscrowStatus::Collateralized,
                   "persisted pending disbursement for an escrow that is not "
                   "Collateralized");
  requireParameter(plan.collateral == escrow.collateral_amount,
                   "persisted pending disbursement does not match the "
                   "escrow's collateral");

  if (plan.holder && !escrow.counterparty) {
    escrow.counterparty = plan.holder;
  }
  entry->pending = plan;
}

void EscrowRegistry::advanceSequencePast(std::uint64_t sequence) {
  std::uint64_t current = sequence_.load();
  while (current < sequence &&
         !sequence_.compare_exchange_weak(current, sequence)) {
  }
}

// -----------------------------------------------------------------------------
// custodyMismatches: escrow book against vault custody
// -----------------------------------------------------------------------------
std::vector<std::string> EscrowRegistry::custodyMismatches() const {
  std::vector<std::string> mismatches;
  std::shared_lock lock(map_mutex_);
  for (const auto& [id, entry] : entries_) {
    std::lock_guard entry_lock(entry->mutex);
    const domain::Escrow& escrow = entry->escrow;
    const domain::Amount locked = vault_.lockedBalance(id);

    bool ok = true;
    switch (escrow.status) {
      case domain::EscrowStatus::Created:
        break;  // an unfinished deposit may hold funds
      case domain::EscrowStatus::Collateralized:
      case domain::EscrowStatus::Exercised:
        // Legs of a pending plan may already be paid.
        ok = entry->pending ? locked <= escrow.collateral_amount
                            : locked == escrow.collateral_amount;
        break;
      case domain::EscrowStatus::Settled:
      case domain::EscrowStatus::Cancelled:
        ok = locked == 0;
        break;
    }

    if (!ok) {
      mismatches.push_back(escrowLabel(id) + " is " +
                           domain::toString(escrow.status) + " with " +
                           std::to_string(escrow.collateral_amount) +
                           " collateral" +
                           (entry->pending ? " (disbursement pending)" : "") +
                           " but the vault holds " + std::to_string(locked));
    }
  }
  return mismatches;
}

// -----------------------------------------------------------------------------
// findEntry
// -----------------------------------------------------------------------------
EscrowRegistry::Entry& EscrowRegistry::findEntry(
    domain::EscrowId escrow_id) const {
  std::shared_lock lock(map_mutex_);
  auto it = entries_.find(escrow_id);
  if (it == entries_.end()) {
    throw EscrowError(ErrorCode::EscrowNotFound,
                      "unknown " + escrowLabel(escrow_id));
  }
  return *it->second;
}

// -----------------------------------------------------------------------------
// planAgainstCurrentGovernance: snapshot, plan, re-check version
// -----------------------------------------------------------------------------
domain::DisbursementPlan EscrowRegistry::planAgainstCurrentGovernance(
    const domain::Escrow& escrow, domain::Price spot,
    const std::optional<domain::Identity>& holder, bool early) const {
  for (int attempt = 1;; ++attempt) {
    const domain::GovernanceConfig config = governance_.snapshot();
    domain::DisbursementPlan plan = SettlementEngine::planDisbursement(
        escrow, spot, holder, config, fee_policy_, early);

    if (governance_.version() == config.version) {
      return plan;
    }
    if (attempt >= kMaxGovernanceAttempts) {
      throw EscrowError(ErrorCode::StaleGovernanceConfig,
                        "governance kept changing while settling " +
                            escrowLabel(escrow.id));
    }
    std::cerr << "[EscrowRegistry] governance moved past version "
              << config.version << " while settling " << escrowLabel(escrow.id)
              << ", recomputing\n";
  }
}

// -----------------------------------------------------------------------------
// executePlan: release every leg, then commit Settled
// -----------------------------------------------------------------------------
std::optional<EscrowRegistry::ReleaseFailure> EscrowRegistry::executePlan(
    Entry& entry, const domain::DisbursementPlan& plan,
    domain::TimestampMs now, Outbox& outbox) {
  domain::Escrow& escrow = entry.escrow;
  const domain::EscrowStatus previous = escrow.status;

  if (plan.early_exercise) {
    transition(escrow, domain::EscrowStatus::Exercised);
  }

  for (const domain::Release& release : plan.releases) {
    try {
      vault_.release(plan.escrow_id, release.leg, release.recipient,
                     escrow.collateral_asset, release.amount);
    } catch (const EscrowError& e) {
      if (escrow.status == domain::EscrowStatus::Exercised) {
        transition(escrow, domain::EscrowStatus::Collateralized);
      }
      // The plan is binding from here on, including who the holder is.
      if (plan.holder && !escrow.counterparty) {
        escrow.counterparty = plan.holder;
      }
      entry.pending = plan;

      std::cerr << "[EscrowRegistry] ERROR: " << escrowLabel(escrow.id)
                << " release of leg " << domain::toString(release.leg)
                << " failed: " << e.what() << ". Disbursement pending.\n";

      DisbursementPendingEvent pending;
      pending.plan = plan;
      pending.failed_leg = release.leg;
      pending.reason = e.what();
      pending.timestamp_ms = now;
      pending.sequence_id = ++sequence_;
      outbox.emplace_back(std::move(pending));

      return ReleaseFailure{release.leg, e.what()};
    }
  }

  if (plan.holder && !escrow.counterparty) {
    escrow.counterparty = plan.holder;
  }
  transition(escrow, domain::EscrowStatus::Settled);
  escrow.collateral_amount = 0;
  escrow.settled_at = now;
  entry.pending.reset();

  std::cout << "[EscrowRegistry] " << escrowLabel(escrow.id) << " settled "
            << domain::toString(plan.outcome) << " at spot " << plan.spot_price
            << ": holder " << plan.holderNet() << ", initializer "
            << plan.initializerNet() << ", fee " << plan.totalFee()
            << " (governance v" << plan.governance_version << ")\n";

  emitUpdate(escrow, previous, now, outbox);

  SettlementEvent settlement;
  settlement.plan = plan;
  settlement.timestamp_ms = now;
  settlement.sequence_id = ++sequence_;
  outbox.emplace_back(std::move(settlement));

  return std::nullopt;
}

// -----------------------------------------------------------------------------
// replayPending
// -----------------------------------------------------------------------------
std::optional<EscrowRegistry::ReleaseFailure> EscrowRegistry::replayPending(
    Entry& entry, domain::TimestampMs now, Outbox& outbox) {
  const domain::DisbursementPlan plan = *entry.pending;
  std::cout << "[EscrowRegistry] replaying pending disbursement of "
            << escrowLabel(plan.escrow_id) << '\n';
  return executePlan(entry, plan, now, outbox);
}

// -----------------------------------------------------------------------------
// transition: apply a status change, rejecting edges outside the graph
// -----------------------------------------------------------------------------
void EscrowRegistry::transition(domain::Escrow& escrow,
                                domain::EscrowStatus next) const {
  if (!isLegalTransition(escrow.status, next)) {
    throw EscrowError(ErrorCode::InvalidState,
                      "illegal transition for " + escrowLabel(escrow.id) +
                          " from " + domain::toString(escrow.status) + " to " +
                          domain::toString(next));
  }
  escrow.status = next;
}

// -----------------------------------------------------------------------------
// Event helpers
// -----------------------------------------------------------------------------
void EscrowRegistry::emitUpdate(const domain::Escrow& escrow,
                                domain::EscrowStatus previous,
                                domain::TimestampMs now, Outbox& outbox) {
  EscrowUpdateEvent update;
  update.escrow = escrow;
  update.previous_status = previous;
  update.timestamp_ms = now;
  update.sequence_id = ++sequence_;
  outbox.emplace_back(std::move(update));
}

void EscrowRegistry::flush(const Outbox& outbox) {
  for (const Event& event : outbox) {
    bus_.publish(event);
  }
}

domain::DisbursementPlan EscrowRegistry::finish(
    const domain::DisbursementPlan& plan,
    const std::optional<ReleaseFailure>& failure, const Outbox& outbox) {
  flush(outbox);
  if (failure) {
    throw EscrowError(ErrorCode::VaultError,
                      "release of " + std::string(domain::toString(failure->leg)) +
                          " leg failed for " + escrowLabel(plan.escrow_id) +
                          ": " + failure->reason + " (disbursement pending)");
  }
  return plan;
}

}  // namespace escrow
