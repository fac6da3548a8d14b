#pragma once

#include "escrow/concurrent/escrow_id_generator.hpp"
#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"
#include "escrow/eventbus/event_bus.hpp"
#include "escrow/governance/governance.hpp"
#include "escrow/vault/i_collateral_vault.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace escrow {

// Arguments of initializeEscrow(). `now` is the caller's clock reading.
struct InitializeEscrowParams {
  domain::OptionType option_type{domain::OptionType::Call};
  domain::ExerciseStyle style{domain::ExerciseStyle::European};
  domain::Price strike_price{0};
  domain::Amount notional{0};
  domain::TimestampMs expiration_time{0};
  std::string collateral_asset;
  std::optional<domain::Identity> counterparty;
  std::optional<domain::Amount> max_collateral;
  domain::TimestampMs now{0};
};

// -----------------------------------------------------------------------------
// EscrowRegistry — escrow lifecycle state machine and escrow book
// -----------------------------------------------------------------------------
//
// @brief  Owns every escrow, enforces the lifecycle graph and the caller
//         rules of each operation, and drives the vault for deposits and
//         settlements. Publishes EscrowUpdateEvent on every transition,
//         SettlementEvent on every completed settlement and
//         DisbursementPendingEvent when the vault refuses a release.
//
// @details
// Lifecycle:
//
//   Created ──deposit──> Collateralized ──settle──────────────> Settled
//      │                       └──exercise──> Exercised ──────────┘
//      └──cancel──> Cancelled
//
// Every status change goes through isLegalTransition(). Settled and
// Cancelled are terminal: any further settle/exercise/cancel fails
// AlreadySettled without side effects.
//
// Commit discipline:
//   The vault is the commit point. A deposit changes the escrow only after
//   vault.lock() returned a receipt. A settlement is computed into a
//   DisbursementPlan first; its legs are then released in order, each
//   under the idempotency key (escrow_id, leg). When every leg went
//   through the escrow becomes Settled. When a leg fails the escrow stays
//   Collateralized, the plan is kept as a pending disbursement and the
//   VaultError is rethrown. The next settleEscrow(), exerciseEarly() or
//   reconcilePending() on that escrow replays the same plan rather than
//   computing a new one, so a holder is never paid twice and a half-paid
//   escrow is never re-priced.
//
// Origination fee:
//   Off by default. When enabled, initializeEscrow() fixes a fee on the
//   required collateral at the current governance rate and collector.
//   depositCollateral() locks amount + fee and releases the fee leg to the
//   collector before committing Collateralized.
//
// Governance staleness:
//   A plan is computed from one Governance::snapshot(). Right before the
//   first release the registry re-reads the governance version. If a fee
//   update slipped in, the plan is recomputed from a fresh snapshot, up to
//   kMaxGovernanceAttempts times, after which the operation fails
//   StaleGovernanceConfig. Fee rate and fee collector therefore always
//   come from the same version.
//
// Thread model:
//   Safe from any thread. Each escrow has its own std::mutex held for the
//   whole operation, so operations on one escrow are serialized and
//   operations on different escrows run in parallel. The map itself is
//   guarded by a std::shared_mutex. Entries are never erased, so an Entry
//   pointer obtained under the shared lock stays valid after it is
//   released. Events are published after every lock has been dropped.
//
// Ownership:
//   Owned by EscrowEngine. Holds references to the EventBus, Governance
//   and vault, all of which must outlive it.
// -----------------------------------------------------------------------------
class EscrowRegistry {
 public:
  static constexpr int kMaxGovernanceAttempts = 3;

  EscrowRegistry(EventBus& bus, Governance& governance, ICollateralVault& vault,
                 domain::FeePolicy fee_policy = domain::FeePolicy::PayoffOnly,
                 bool origination_fee = false);

  EscrowRegistry(const EscrowRegistry&) = delete;
  EscrowRegistry& operator=(const EscrowRegistry&) = delete;
  EscrowRegistry(EscrowRegistry&&) = delete;
  EscrowRegistry& operator=(EscrowRegistry&&) = delete;

  // -------------------------------------------------------------------------
  // initializeEscrow(caller, params)
  // -------------------------------------------------------------------------
  //
  // @brief  Records a new escrow in Created, with `caller` as the option
  //         writer (initializer).
  //
  // With the origination fee enabled, the fee and its collector are fixed
  // here from one governance snapshot.
  //
  // @throws InvalidParameters for an empty caller or asset, zero strike or
  //         notional, an expiration not after params.now, a counterparty
  //         equal to the caller, a Call without max_collateral or a zero
  //         max_collateral.
  // @throws ArithmeticOverflow if a Put's strike * notional overflows.
  //
  // @return The new escrow id.
  // -------------------------------------------------------------------------
  domain::EscrowId initializeEscrow(const domain::Identity& caller,
                                    const InitializeEscrowParams& params);

  // -------------------------------------------------------------------------
  // depositCollateral(caller, escrow_id, asset, amount, now)
  // -------------------------------------------------------------------------
  //
  // @brief  Locks `amount` of `asset` from the initializer in the vault and
  //         moves the escrow to Collateralized.
  //
  // @details
  // Checks, in order: escrow exists, caller is the initializer, status is
  // Created, asset matches, amount covers the required collateral. Only
  // then is the vault called. A vault failure leaves the escrow untouched.
  // `now` only stamps the published event.
  //
  // An escrow with an origination fee locks amount + origination_fee and
  // pays the fee leg before committing. collateral_amount is `amount`.
  //
  // @throws EscrowNotFound, Unauthorized, InvalidState,
  //         IncorrectCollateralAsset, InsufficientCollateral, VaultError,
  //         ArithmeticOverflow.
  // -------------------------------------------------------------------------
  void depositCollateral(const domain::Identity& caller,
                         domain::EscrowId escrow_id, const std::string& asset,
                         domain::Amount amount, domain::TimestampMs now = 0);

  // -------------------------------------------------------------------------
  // assignCounterparty(caller, escrow_id, holder)
  // -------------------------------------------------------------------------
  // Names the option holder of an escrow created without one. Initializer
  // only, before settlement, and only once.
  //
  // @throws EscrowNotFound, Unauthorized, AlreadySettled, InvalidState,
  //         InvalidParameters.
  // -------------------------------------------------------------------------
  void assignCounterparty(const domain::Identity& caller,
                          domain::EscrowId escrow_id,
                          const domain::Identity& holder,
                          domain::TimestampMs now = 0);

  // -------------------------------------------------------------------------
  // exerciseEarly(caller, escrow_id, spot_price, now)
  // -------------------------------------------------------------------------
  //
  // @brief  Holder-initiated settlement of an American option before
  //         expiration.
  //
  // @details
  // Checks, in order:
  //   1. escrow exists                          EscrowNotFound
  //   2. not Settled/Cancelled                  AlreadySettled
  //   3. Collateralized                         InvalidState
  //   4. (pending disbursement → replay it, skip 5-8)
  //   5. American                               NotAmerican
  //   6. now < expiration_time                  Expired
  //   7. caller is the holder (or becomes it),
  //      never the initializer                  Unauthorized
  //   8. ITM at spot_price                      NotITM
  //
  // @return The executed plan.
  // @throws Any of the above, plus StaleGovernanceConfig, VaultError.
  // -------------------------------------------------------------------------
  domain::DisbursementPlan exerciseEarly(const domain::Identity& caller,
                                         domain::EscrowId escrow_id,
                                         domain::Price spot_price,
                                         domain::TimestampMs now);

  // -------------------------------------------------------------------------
  // settleEscrow(caller, escrow_id, spot_price, now)
  // -------------------------------------------------------------------------
  //
  // @brief  Settles a Collateralized escrow at or after expiration.
  //
  // @details
  // Checks, in order: exists (EscrowNotFound), not terminal
  // (AlreadySettled), Collateralized (InvalidState), pending disbursement
  // (replayed), now >= expiration_time (NotExpired), caller permitted
  // (Unauthorized).
  //
  // Permitted callers are the initializer, the counterparty, or, when no
  // counterparty is set, anyone else, who then becomes the holder. An
  // initializer settling an escrow that has no holder gets the whole
  // collateral back.
  //
  // @return The executed plan.
  // -------------------------------------------------------------------------
  domain::DisbursementPlan settleEscrow(const domain::Identity& caller,
                                        domain::EscrowId escrow_id,
                                        domain::Price spot_price,
                                        domain::TimestampMs now);

  // -------------------------------------------------------------------------
  // cancelEscrow(caller, escrow_id)
  // -------------------------------------------------------------------------
  // Created → Cancelled. Initializer only. Funds an unfinished deposit
  // left in custody are returned to the initializer first.
  //
  // @throws EscrowNotFound, Unauthorized, AlreadySettled, InvalidState,
  //         VaultError.
  // -------------------------------------------------------------------------
  void cancelEscrow(const domain::Identity& caller, domain::EscrowId escrow_id,
                    domain::TimestampMs now = 0);

  // -------------------------------------------------------------------------
  // reconcilePending(now)
  // -------------------------------------------------------------------------
  //
  // @brief  Replays every pending disbursement.
  //
  // @details
  // Escrows whose replay fails again stay pending; the failure is logged
  // and a fresh DisbursementPendingEvent is published for each.
  //
  // @return Number of escrows that reached Settled.
  // -------------------------------------------------------------------------
  std::size_t reconcilePending(domain::TimestampMs now);

  // Read-only copy of an escrow. @throws EscrowNotFound.
  domain::Escrow getEscrow(domain::EscrowId escrow_id) const;

  // Copies of every escrow, ordered by id.
  std::vector<domain::Escrow> snapshots() const;

  std::optional<domain::DisbursementPlan> pendingDisbursement(
      domain::EscrowId escrow_id) const;

  std::size_t pendingCount() const;

  std::size_t size() const;

  domain::FeePolicy feePolicy() const { return fee_policy_; }

  bool chargesOriginationFee() const { return origination_fee_; }

  // -------------------------------------------------------------------------
  // hydrateEscrow(escrow)
  // -------------------------------------------------------------------------
  //
  // @brief  Loads a persisted escrow into the book.
  //
  // @details
  // **Warm-up only.** Call from EscrowEngine::start() before any command
  // is accepted. Inserts the entry and advances the id generator past
  // escrow.id. An id already in the book is rejected, never overwritten:
  // a live Entry may be locked by an in-flight operation. Does not publish.
  //
  // @throws InvalidParameters for id 0, an id already in the book, or an
  //         escrow persisted in the transient Exercised status.
  // -------------------------------------------------------------------------
  void hydrateEscrow(const domain::Escrow& escrow);

  // -------------------------------------------------------------------------
  // hydratePending(plan)
  // -------------------------------------------------------------------------
  // Warm-up only, after hydrateEscrow(). Restores an interrupted
  // disbursement so the next settle, exercise or reconcile replays it. The
  // plan's holder becomes the counterparty if none is set.
  //
  // @throws InvalidParameters if the escrow is unknown, not Collateralized,
  //         or holds a different collateral amount than the plan.
  // -------------------------------------------------------------------------
  void hydratePending(const domain::DisbursementPlan& plan);

  // Warm-up only. Moves the event sequence to at least `sequence`, so new
  // events order after every persisted revision.
  void advanceSequencePast(std::uint64_t sequence);

  // -------------------------------------------------------------------------
  // custodyMismatches()
  // -------------------------------------------------------------------------
  //
  // @brief  Compares every escrow with the vault's lockedBalance().
  //
  // @details
  // Expected custody by status:
  //   Created                       anything (unfinished deposit)
  //   Collateralized                == collateral_amount
  //   Collateralized + pending plan <= collateral_amount
  //   Settled, Cancelled            0
  //
  // @return One line per escrow that breaks the rule. Empty when the book
  //         and the vault agree.
  // -------------------------------------------------------------------------
  std::vector<std::string> custodyMismatches() const;

  // -------------------------------------------------------------------------
  // isLegalTransition(from, to)
  // -------------------------------------------------------------------------
  // Legal transitions:
  //   Created        → Collateralized, Cancelled
  //   Collateralized → Exercised, Settled
  //   Exercised      → Settled, Collateralized (vault refused a release)
  //   Settled        → (none, terminal)
  //   Cancelled      → (none, terminal)
  // -------------------------------------------------------------------------
  static bool isLegalTransition(domain::EscrowStatus from,
                                domain::EscrowStatus to);

 private:
  struct Entry {
    mutable std::mutex mutex;
    domain::Escrow escrow;
    std::optional<domain::DisbursementPlan> pending;
  };

  // Events collected under the escrow lock, published after it.
  using Outbox = std::vector<Event>;

  // Result of running a plan's legs against the vault.
  struct ReleaseFailure {
    domain::Leg leg{domain::Leg::Payoff};
    std::string reason;
  };

  Entry& findEntry(domain::EscrowId escrow_id) const;

  // Plans a settlement against a governance snapshot that is still current
  // after planning. Caller holds entry.mutex.
  domain::DisbursementPlan planAgainstCurrentGovernance(
      const domain::Escrow& escrow, domain::Price spot,
      const std::optional<domain::Identity>& holder, bool early) const;

  // Runs every leg of `plan` in order. On success commits Settled; on the
  // first vault failure stores the plan as pending and returns the failure.
  // Caller holds entry.mutex.
  std::optional<ReleaseFailure> executePlan(Entry& entry,
                                            const domain::DisbursementPlan& plan,
                                            domain::TimestampMs now,
                                            Outbox& outbox);

  // Replays entry.pending. Caller holds entry.mutex.
  std::optional<ReleaseFailure> replayPending(Entry& entry,
                                              domain::TimestampMs now,
                                              Outbox& outbox);

  void transition(domain::Escrow& escrow, domain::EscrowStatus next) const;

  void emitUpdate(const domain::Escrow& escrow, domain::EscrowStatus previous,
                  domain::TimestampMs now, Outbox& outbox);

  void flush(const Outbox& outbox);

  // Publishes the outbox, then rethrows a release failure as VaultError.
  domain::DisbursementPlan finish(const domain::DisbursementPlan& plan,
                                  const std::optional<ReleaseFailure>& failure,
                                  const Outbox& outbox);

  EventBus& bus_;
  Governance& governance_;
  ICollateralVault& vault_;
  const domain::FeePolicy fee_policy_;
  const bool origination_fee_;

  EscrowIdGenerator id_generator_;
  std::atomic<std::uint64_t> sequence_{0};

  mutable std::shared_mutex map_mutex_;  // Protects entries_ (not the Entry)
  std::map<domain::EscrowId, std::unique_ptr<Entry>> entries_;
};

}  // namespace escrow
