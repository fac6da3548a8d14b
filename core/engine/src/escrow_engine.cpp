#include "escrow/engine/escrow_engine.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/events/disbursement_pending_event.hpp"
#include "escrow/events/escrow_update_event.hpp"
#include "escrow/events/governance_update_event.hpp"
#include "escrow/network/json_codec.hpp"

#include <iostream>
#include <limits>
#include <utility>

namespace escrow {

namespace {

// -----------------------------------------------------------------------------
// Request field accessors. Every failure is InvalidParameters.
// -----------------------------------------------------------------------------
const nlohmann::json& field(const nlohmann::json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      std::string("missing field '") + key + "'");
  }
  return *it;
}

std::string stringField(const nlohmann::json& request, const char* key) {
  const nlohmann::json& value = field(request, key);
  if (!value.is_string()) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      std::string("field '") + key + "' must be a string");
  }
  return value.get<std::string>();
}

std::uint64_t unsignedField(const nlohmann::json& request, const char* key) {
  const nlohmann::json& value = field(request, key);
  if (!value.is_number_unsigned()) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      std::string("field '") + key +
                          "' must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

std::int64_t integerField(const nlohmann::json& request, const char* key) {
  const nlohmann::json& value = field(request, key);
  if (!value.is_number_integer()) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      std::string("field '") + key + "' must be an integer");
  }
  return value.get<std::int64_t>();
}

std::uint32_t feeRateField(const nlohmann::json& request) {
  const std::uint64_t rate = unsignedField(request, "fee_rate_bps");
  if (rate > std::numeric_limits<std::uint32_t>::max()) {
    throw EscrowError(ErrorCode::FeeRateOutOfBounds,
                      "fee rate " + std::to_string(rate) + " bps is out of range");
  }
  return static_cast<std::uint32_t>(rate);
}

bool hasField(const nlohmann::json& request, const char* key) {
  auto it = request.find(key);
  return it != request.end() && !it->is_null();
}

nlohmann::json ok() {
  nlohmann::json response;
  response["status"] = "ok";
  return response;
}

nlohmann::json errorResponse(ErrorCode code, const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["error"] = toString(code);
  response["message"] = message;
  response["retryable"] = isRetryable(code);
  return response;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: initialize_governance from the configuration
// -----------------------------------------------------------------------------
EscrowEngine::EscrowEngine(EngineConfig config, ICollateralVault& vault,
                           ITimeProvider& clock)
    : config_(std::move(config)),
      vault_(vault),
      clock_(clock),
      governance_(bus_, config_.governance_authority, config_.fee_rate_bps,
                  config_.fee_collector),
      registry_(bus_, governance_, vault_, config_.fee_policy,
                config_.origination_fee) {}

EscrowEngine::~EscrowEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): synchronization gate, then open the command surface
// -----------------------------------------------------------------------------
void EscrowEngine::start(IEscrowStore* store) {
  if (running_.load()) {
    return;
  }

  // ---  1) Hydrate from persisted state (first start only) ------------------
  if (store != nullptr && !hydrated_) {
    if (auto persisted = store->loadGovernance()) {
      governance_.hydrate(*persisted);
      std::cout << "[EscrowEngine] governance restored at version "
                << persisted->version << "\n";
    } else {
      store->saveGovernance(governance_.snapshot());
    }

    registry_.advanceSequencePast(store->lastRevision());

    const std::vector<domain::Escrow> escrows = store->loadEscrows();
    for (const domain::Escrow& escrow : escrows) {
      registry_.hydrateEscrow(escrow);
    }
    const std::vector<domain::DisbursementPlan> pending = store->loadPending();
    for (const domain::DisbursementPlan& plan : pending) {
      registry_.hydratePending(plan);
    }
    std::cout << "[EscrowEngine] hydrated " << escrows.size()
              << " escrow(s), " << pending.size()
              << " pending disbursement(s)\n";
    hydrated_ = true;
  }

  // ---  2) Custody reconciliation -------------------------------------------
  // The book must agree with the vault before any command is accepted.
  const std::vector<std::string> mismatches = registry_.custodyMismatches();
  if (!mismatches.empty()) {
    for (const std::string& line : mismatches) {
      std::cerr << "[EscrowEngine] ERROR: custody mismatch: " << line << "\n";
    }
    throw EscrowError(ErrorCode::InvalidState,
                      std::to_string(mismatches.size()) +
                          " escrow(s) disagree with vault custody, first: " +
                          mismatches.front());
  }

  // ---  3) Write-through ----------------------------------------------------
  // Each save carries the event's sequence_id; the store drops a save that
  // arrives after a newer one for the same escrow.
  // A failed save is logged; the operation itself has already committed.
  store_ = store;
  if (store_ != nullptr) {
    subscriptions_.push_back(bus_.subscribe<EscrowUpdateEvent>(
        [this](const EscrowUpdateEvent& e) {
          try {
            store_->saveEscrow(e.escrow, e.sequence_id);
          } catch (const EscrowError& err) {
            std::cerr << "[EscrowEngine] ERROR: persisting escrow "
                      << e.escrow.id << " failed: " << err.what() << "\n";
          }
        }));
    subscriptions_.push_back(bus_.subscribe<DisbursementPendingEvent>(
        [this](const DisbursementPendingEvent& e) {
          try {
            store_->savePending(e.plan, e.sequence_id);
          } catch (const EscrowError& err) {
            std::cerr << "[EscrowEngine] ERROR: persisting pending "
                         "disbursement of escrow "
                      << e.plan.escrow_id << " failed: " << err.what()
                      << "\n";
          }
        }));
    subscriptions_.push_back(bus_.subscribe<GovernanceUpdateEvent>(
        [this](const GovernanceUpdateEvent& e) {
          try {
            store_->saveGovernance(e.config);
          } catch (const EscrowError& err) {
            std::cerr << "[EscrowEngine] ERROR: persisting governance "
                         "failed: " << err.what() << "\n";
          }
        }));
  }

  // ---  4) IPC server and telemetry bridge ----------------------------------
  if (config_.ipc_enabled) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.cmd_endpoint, config_.pub_endpoint);
    ipc_server_->start();

    subscriptions_.push_back(
        bus_.subscribe([this](const Event& e) { ipc_server_->pushTelemetry(e); }));
  }

  running_.store(true);

  std::cout << "[EscrowEngine] started. fee_policy="
            << domain::toString(config_.fee_policy)
            << " ipc=" << (ipc_server_ ? "on" : "off")
            << " store=" << (store_ ? "on" : "off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EscrowEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  for (EventBus::SubscriptionId id : subscriptions_) {
    bus_.unsubscribe(id);
  }
  subscriptions_.clear();

  // Joins the IPC thread, which may still be inside executeCommand().
  ipc_server_.reset();
  store_ = nullptr;

  std::cout << "[EscrowEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON in, JSON out
// -----------------------------------------------------------------------------
std::string EscrowEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  try {
    const nlohmann::json request = nlohmann::json::parse(cmd);
    if (!request.is_object()) {
      throw EscrowError(ErrorCode::InvalidParameters,
                        "command must be a JSON object");
    }
    response = dispatch(request);
  } catch (const EscrowError& e) {
    response = errorResponse(e.code(), e.what());
  } catch (const nlohmann::json::exception& e) {
    response = errorResponse(ErrorCode::InvalidParameters, e.what());
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per operation
// -----------------------------------------------------------------------------
nlohmann::json EscrowEngine::dispatch(const nlohmann::json& request) {
  const std::string op = stringField(request, "op");
  nlohmann::json response = ok();

  if (op == "ping") {
    response["response"] = "pong";
    return response;
  }

  if (op == "status") {
    response["escrows"] = registry_.size();
    response["pending_disbursements"] = registry_.pendingCount();
    response["fee_policy"] = domain::toString(registry_.feePolicy());
    response["origination_fee"] = registry_.chargesOriginationFee();
    response["governance"] = toJson(governance_.snapshot());
    response["time_ms"] = clock_.now_ms();
    return response;
  }

  if (op == "get_escrow") {
    const domain::EscrowId id = unsignedField(request, "escrow_id");
    response["escrow"] = toJson(registry_.getEscrow(id));
    if (auto pending = registry_.pendingDisbursement(id)) {
      response["pending_disbursement"] = toJson(*pending);
    }
    return response;
  }

  if (op == "reconcile") {
    response["settled"] = registry_.reconcilePending(nowFrom(request));
    response["pending_disbursements"] = registry_.pendingCount();
    return response;
  }

  // Everything below acts on behalf of a caller.
  const domain::Identity caller = stringField(request, "caller");

  if (op == "initialize_escrow") {
    InitializeEscrowParams params;
    params.option_type =
        optionTypeFromString(stringField(request, "option_type"));
    params.style = exerciseStyleFromString(stringField(request, "style"));
    params.strike_price = unsignedField(request, "strike_price");
    params.notional = unsignedField(request, "notional");
    params.expiration_time = integerField(request, "expiration_time");
    params.collateral_asset = stringField(request, "collateral_asset");
    if (hasField(request, "counterparty")) {
      params.counterparty = stringField(request, "counterparty");
    }
    if (hasField(request, "max_collateral")) {
      params.max_collateral = unsignedField(request, "max_collateral");
    }
    params.now = nowFrom(request);

    const domain::EscrowId id = registry_.initializeEscrow(caller, params);
    response["escrow_id"] = id;
    response["escrow"] = toJson(registry_.getEscrow(id));
  } else if (op == "deposit_collateral") {
    const domain::EscrowId id = unsignedField(request, "escrow_id");
    registry_.depositCollateral(caller, id, stringField(request, "asset"),
                                unsignedField(request, "amount"),
                                nowFrom(request));
    response["escrow"] = toJson(registry_.getEscrow(id));
  } else if (op == "assign_counterparty") {
    const domain::EscrowId id = unsignedField(request, "escrow_id");
    registry_.assignCounterparty(caller, id, stringField(request, "holder"),
                                 nowFrom(request));
    response["escrow"] = toJson(registry_.getEscrow(id));
  } else if (op == "exercise_early") {
    const domain::EscrowId id = unsignedField(request, "escrow_id");
    response["settlement"] = toJson(registry_.exerciseEarly(
        caller, id, unsignedField(request, "spot_price"), nowFrom(request)));
    response["escrow"] = toJson(registry_.getEscrow(id));
  } else if (op == "settle_escrow") {
    const domain::EscrowId id = unsignedField(request, "escrow_id");
    response["settlement"] = toJson(registry_.settleEscrow(
        caller, id, unsignedField(request, "spot_price"), nowFrom(request)));
    response["escrow"] = toJson(registry_.getEscrow(id));
  } else if (op == "cancel_escrow") {
    const domain::EscrowId id = unsignedField(request, "escrow_id");
    registry_.cancelEscrow(caller, id, nowFrom(request));
    response["escrow"] = toJson(registry_.getEscrow(id));
  } else if (op == "update_fee_rate") {
    response["version"] = governance_.updateFeeRate(caller, feeRateField(request));
    response["governance"] = toJson(governance_.snapshot());
  } else if (op == "update_fee_collector") {
    response["version"] = governance_.updateFeeCollector(
        caller, stringField(request, "fee_collector"));
    response["governance"] = toJson(governance_.snapshot());
  } else if (op == "update_governance") {
    response["version"] = governance_.updateGovernance(
        caller, feeRateField(request), stringField(request, "fee_collector"));
    response["governance"] = toJson(governance_.snapshot());
  } else if (op == "transfer_governance") {
    response["version"] = governance_.transferGovernance(
        caller, stringField(request, "new_authority"));
    response["governance"] = toJson(governance_.snapshot());
  } else {
    throw EscrowError(ErrorCode::InvalidParameters, "unknown op '" + op + "'");
  }

  return response;
}

domain::TimestampMs EscrowEngine::nowFrom(const nlohmann::json& request) const {
  if (hasField(request, "now")) {
    return integerField(request, "now");
  }
  return clock_.now_ms();
}

}  // namespace escrow
