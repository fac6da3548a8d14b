#include "escrow/governance/governance.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/events/governance_update_event.hpp"

#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace escrow {

namespace {

void requireFeeRateInBounds(std::uint32_t rate) {
  if (rate > domain::kMaxFeeBps) {
    throw EscrowError(ErrorCode::FeeRateOutOfBounds,
                      "fee rate " + std::to_string(rate) +
                          " bps exceeds maximum of " +
                          std::to_string(domain::kMaxFeeBps) + " bps");
  }
}

void requireIdentity(const domain::Identity& id, const char* field) {
  if (id.empty()) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      std::string(field) + " must not be empty");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: initialize_governance
// -----------------------------------------------------------------------------
Governance::Governance(EventBus& bus, domain::Identity authority,
                       std::uint32_t fee_rate_bps,
                       domain::Identity fee_collector)
    : bus_(bus) {
  requireIdentity(authority, "authority");
  requireIdentity(fee_collector, "fee_collector");
  requireFeeRateInBounds(fee_rate_bps);

  config_.authority = std::move(authority);
  config_.fee_rate_bps = fee_rate_bps;
  config_.fee_collector = std::move(fee_collector);
  config_.version = 1;
}

// -----------------------------------------------------------------------------
// updateFeeRate
// -----------------------------------------------------------------------------
std::uint64_t Governance::updateFeeRate(const domain::Identity& caller,
                                        std::uint32_t new_rate) {
  domain::GovernanceConfig after;
  {
    std::unique_lock lock(mutex_);
    requireAuthority(caller, "update_fee_rate");
    requireFeeRateInBounds(new_rate);

    config_.fee_rate_bps = new_rate;
    ++config_.version;
    after = config_;
  }

  std::cout << "[Governance] fee rate set to " << new_rate
            << " bps (version " << after.version << ")\n";
  publish(after, "fee_rate");
  return after.version;
}

// -----------------------------------------------------------------------------
// updateFeeCollector
// -----------------------------------------------------------------------------
std::uint64_t Governance::updateFeeCollector(
    const domain::Identity& caller, const domain::Identity& new_collector) {
  domain::GovernanceConfig after;
  {
    std::unique_lock lock(mutex_);
    requireAuthority(caller, "update_fee_collector");
    requireIdentity(new_collector, "fee_collector");

    config_.fee_collector = new_collector;
    ++config_.version;
    after = config_;
  }

  std::cout << "[Governance] fee collector set to " << new_collector
            << " (version " << after.version << ")\n";
  publish(after, "fee_collector");
  return after.version;
}

// -----------------------------------------------------------------------------
// updateGovernance: rate + collector as one mutation
// -----------------------------------------------------------------------------
std::uint64_t Governance::updateGovernance(
    const domain::Identity& caller, std::uint32_t new_rate,
    const domain::Identity& new_collector) {
  domain::GovernanceConfig after;
  {
    std::unique_lock lock(mutex_);
    requireAuthority(caller, "update_governance");
    requireFeeRateInBounds(new_rate);
    requireIdentity(new_collector, "fee_collector");

    config_.fee_rate_bps = new_rate;
    config_.fee_collector = new_collector;
    ++config_.version;
    after = config_;
  }

  std::cout << "[Governance] fee rate " << new_rate << " bps, collector "
            << new_collector << " (version " << after.version << ")\n";
  publish(after, "governance");
  return after.version;
}

// -----------------------------------------------------------------------------
// transferGovernance: single-step authority handoff
// -----------------------------------------------------------------------------
std::uint64_t Governance::transferGovernance(
    const domain::Identity& caller, const domain::Identity& new_authority) {
  domain::GovernanceConfig after;
  domain::Identity previous;
  {
    std::unique_lock lock(mutex_);
    requireAuthority(caller, "transfer_governance");
    requireIdentity(new_authority, "new_authority");

    previous = config_.authority;
    config_.authority = new_authority;
    ++config_.version;
    after = config_;
  }

  // No acceptance step exists: if new_authority is wrong, governance is
  // unrecoverable. Make the handoff loud.
  std::cerr << "[Governance] WARNING: authority transferred from " << previous
            << " to " << new_authority
            << " without confirmation by the new authority (version "
            << after.version << ")\n";
  publish(after, "authority");
  return after.version;
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
domain::GovernanceConfig Governance::snapshot() const {
  std::shared_lock lock(mutex_);
  return config_;
}

std::uint64_t Governance::version() const {
  std::shared_lock lock(mutex_);
  return config_.version;
}

void Governance::ensureCurrent(std::uint64_t version) const {
  std::shared_lock lock(mutex_);
  if (config_.version != version) {
    throw EscrowError(ErrorCode::StaleGovernanceConfig,
                      "governance changed from version " +
                          std::to_string(version) + " to " +
                          std::to_string(config_.version));
  }
}

// -----------------------------------------------------------------------------
// hydrate: warm-up from persisted state
// -----------------------------------------------------------------------------
void Governance::hydrate(const domain::GovernanceConfig& config) {
  requireIdentity(config.authority, "authority");
  requireIdentity(config.fee_collector, "fee_collector");
  requireFeeRateInBounds(config.fee_rate_bps);
  if (config.version == 0) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      "persisted governance record has version 0");
  }

  std::unique_lock lock(mutex_);
  config_ = config;
}

// -----------------------------------------------------------------------------
// requireAuthority
// -----------------------------------------------------------------------------
void Governance::requireAuthority(const domain::Identity& caller,
                                  const char* operation) const {
  if (caller != config_.authority) {
    throw EscrowError(ErrorCode::Unauthorized,
                      std::string(operation) + ": caller '" + caller +
                          "' is not the governance authority");
  }
}

// -----------------------------------------------------------------------------
// publish
// -----------------------------------------------------------------------------
void Governance::publish(const domain::GovernanceConfig& config,
                         const char* change) {
  GovernanceUpdateEvent event;
  event.config = config;
  event.change = change;
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

}  // namespace escrow
