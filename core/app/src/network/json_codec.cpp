#include "escrow/network/json_codec.hpp"
#include "escrow/error/escrow_error.hpp"

namespace escrow {

namespace {

[[noreturn]] void unknownName(const char* kind, const std::string& name) {
  throw EscrowError(ErrorCode::InvalidParameters,
                    std::string("unknown ") + kind + " '" + name + "'");
}

}  // namespace

// -----------------------------------------------------------------------------
// Escrow
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Escrow& escrow) {
  nlohmann::json j;
  j["escrow_id"] = escrow.id;
  j["initializer"] = escrow.initializer;
  j["counterparty"] = escrow.counterparty ? nlohmann::json(*escrow.counterparty)
                                          : nlohmann::json(nullptr);
  j["option_type"] = domain::toString(escrow.option_type);
  j["style"] = domain::toString(escrow.style);
  j["strike_price"] = escrow.strike_price;
  j["notional"] = escrow.notional;
  j["expiration_time"] = escrow.expiration_time;
  j["collateral_asset"] = escrow.collateral_asset;
  j["collateral_amount"] = escrow.collateral_amount;
  j["max_collateral"] = escrow.max_collateral
                            ? nlohmann::json(*escrow.max_collateral)
                            : nlohmann::json(nullptr);
  j["status"] = domain::toString(escrow.status);
  j["created_at"] = escrow.created_at;
  j["lock_receipt"] = escrow.lock_receipt ? nlohmann::json(*escrow.lock_receipt)
                                          : nlohmann::json(nullptr);
  j["settled_at"] = escrow.settled_at ? nlohmann::json(*escrow.settled_at)
                                      : nlohmann::json(nullptr);
  j["origination_fee"] = escrow.origination_fee;
  j["origination_fee_collector"] =
      escrow.origination_fee_collector
          ? nlohmann::json(*escrow.origination_fee_collector)
          : nlohmann::json(nullptr);
  return j;
}

domain::Escrow escrowFromJson(const nlohmann::json& j) {
  domain::Escrow escrow;
  escrow.id = j.at("escrow_id").get<domain::EscrowId>();
  escrow.initializer = j.at("initializer").get<std::string>();
  if (j.contains("counterparty") && !j["counterparty"].is_null()) {
    escrow.counterparty = j["counterparty"].get<std::string>();
  }
  escrow.option_type = optionTypeFromString(j.at("option_type").get<std::string>());
  escrow.style = exerciseStyleFromString(j.at("style").get<std::string>());
  escrow.strike_price = j.at("strike_price").get<domain::Price>();
  escrow.notional = j.at("notional").get<domain::Amount>();
  escrow.expiration_time = j.at("expiration_time").get<domain::TimestampMs>();
  escrow.collateral_asset = j.at("collateral_asset").get<std::string>();
  escrow.collateral_amount = j.value("collateral_amount", domain::Amount{0});
  if (j.contains("max_collateral") && !j["max_collateral"].is_null()) {
    escrow.max_collateral = j["max_collateral"].get<domain::Amount>();
  }
  escrow.status = escrowStatusFromString(j.at("status").get<std::string>());
  escrow.created_at = j.value("created_at", domain::TimestampMs{0});
  if (j.contains("lock_receipt") && !j["lock_receipt"].is_null()) {
    escrow.lock_receipt = j["lock_receipt"].get<std::string>();
  }
  if (j.contains("settled_at") && !j["settled_at"].is_null()) {
    escrow.settled_at = j["settled_at"].get<domain::TimestampMs>();
  }
  escrow.origination_fee = j.value("origination_fee", domain::Amount{0});
  if (j.contains("origination_fee_collector") &&
      !j["origination_fee_collector"].is_null()) {
    escrow.origination_fee_collector =
        j["origination_fee_collector"].get<std::string>();
  }
  return escrow;
}

// -----------------------------------------------------------------------------
// DisbursementPlan
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::DisbursementPlan& plan) {
  nlohmann::json j;
  j["escrow_id"] = plan.escrow_id;
  j["outcome"] = domain::toString(plan.outcome);
  j["early_exercise"] = plan.early_exercise;
  j["spot_price"] = plan.spot_price;
  j["collateral"] = plan.collateral;
  j["payoff"] = plan.payoff;
  j["payoff_fee"] = plan.payoff_fee;
  j["returned"] = plan.returned;
  j["return_fee"] = plan.return_fee;
  j["holder"] = plan.holder ? nlohmann::json(*plan.holder)
                            : nlohmann::json(nullptr);
  j["holder_net"] = plan.holderNet();
  j["initializer_net"] = plan.initializerNet();
  j["total_fee"] = plan.totalFee();
  j["fee_collector"] = plan.fee_collector;
  j["fee_rate_bps"] = plan.fee_rate_bps;
  j["governance_version"] = plan.governance_version;

  nlohmann::json legs = nlohmann::json::array();
  for (const domain::Release& release : plan.releases) {
    legs.push_back({{"leg", domain::toString(release.leg)},
                    {"recipient", release.recipient},
                    {"amount", release.amount}});
  }
  j["releases"] = std::move(legs);
  return j;
}

// Derived fields (holder_net, initializer_net, total_fee) are ignored.
domain::DisbursementPlan planFromJson(const nlohmann::json& j) {
  domain::DisbursementPlan plan;
  plan.escrow_id = j.at("escrow_id").get<domain::EscrowId>();
  plan.outcome = outcomeFromString(j.at("outcome").get<std::string>());
  plan.early_exercise = j.at("early_exercise").get<bool>();
  plan.spot_price = j.at("spot_price").get<domain::Price>();
  plan.collateral = j.at("collateral").get<domain::Amount>();
  plan.payoff = j.at("payoff").get<domain::Amount>();
  plan.payoff_fee = j.at("payoff_fee").get<domain::Amount>();
  plan.returned = j.at("returned").get<domain::Amount>();
  plan.return_fee = j.at("return_fee").get<domain::Amount>();
  if (j.contains("holder") && !j["holder"].is_null()) {
    plan.holder = j["holder"].get<std::string>();
  }
  plan.fee_collector = j.at("fee_collector").get<std::string>();
  plan.fee_rate_bps = j.at("fee_rate_bps").get<std::uint32_t>();
  plan.governance_version = j.at("governance_version").get<std::uint64_t>();

  for (const nlohmann::json& leg : j.at("releases")) {
    domain::Release release;
    release.leg = legFromString(leg.at("leg").get<std::string>());
    release.recipient = leg.at("recipient").get<std::string>();
    release.amount = leg.at("amount").get<domain::Amount>();
    plan.releases.push_back(std::move(release));
  }
  return plan;
}

// -----------------------------------------------------------------------------
// GovernanceConfig
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::GovernanceConfig& config) {
  nlohmann::json j;
  j["authority"] = config.authority;
  j["fee_rate_bps"] = config.fee_rate_bps;
  j["fee_collector"] = config.fee_collector;
  j["version"] = config.version;
  return j;
}

domain::GovernanceConfig governanceFromJson(const nlohmann::json& j) {
  domain::GovernanceConfig config;
  config.authority = j.at("authority").get<std::string>();
  config.fee_rate_bps = j.at("fee_rate_bps").get<std::uint32_t>();
  config.fee_collector = j.at("fee_collector").get<std::string>();
  config.version = j.value("version", std::uint64_t{1});
  return config;
}

// -----------------------------------------------------------------------------
// Enum parsers
// -----------------------------------------------------------------------------
domain::OptionType optionTypeFromString(const std::string& name) {
  if (name == "Call" || name == "call") return domain::OptionType::Call;
  if (name == "Put" || name == "put") return domain::OptionType::Put;
  unknownName("option_type", name);
}

domain::ExerciseStyle exerciseStyleFromString(const std::string& name) {
  if (name == "American" || name == "american") {
    return domain::ExerciseStyle::American;
  }
  if (name == "European" || name == "european") {
    return domain::ExerciseStyle::European;
  }
  unknownName("style", name);
}

domain::FeePolicy feePolicyFromString(const std::string& name) {
  if (name == "payoff_only") return domain::FeePolicy::PayoffOnly;
  if (name == "all_disbursements") return domain::FeePolicy::AllDisbursements;
  unknownName("fee_policy", name);
}

domain::Outcome outcomeFromString(const std::string& name) {
  if (name == "ITM") return domain::Outcome::InTheMoney;
  if (name == "OTM") return domain::Outcome::OutOfTheMoney;
  unknownName("outcome", name);
}

domain::Leg legFromString(const std::string& name) {
  using L = domain::Leg;
  for (L leg : {L::Payoff, L::PayoffFee, L::Return, L::ReturnFee,
                L::OriginationFee}) {
    if (name == domain::toString(leg)) return leg;
  }
  unknownName("leg", name);
}

domain::EscrowStatus escrowStatusFromString(const std::string& name) {
  using S = domain::EscrowStatus;
  if (name == "Created") return S::Created;
  if (name == "Collateralized") return S::Collateralized;
  if (name == "Exercised") return S::Exercised;
  if (name == "Settled") return S::Settled;
  if (name == "Cancelled") return S::Cancelled;
  unknownName("status", name);
}

}  // namespace escrow
