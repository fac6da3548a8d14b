#pragma once

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// JSON codec for the command protocol and telemetry
// -----------------------------------------------------------------------------
// Field names are snake_case and enums travel as their toString() names.
// Amounts and prices are unsigned 64-bit JSON numbers.
//
// The *FromString parsers throw EscrowError(InvalidParameters) on an
// unknown name, so a malformed command maps to the same error code as any
// other bad argument.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Escrow& escrow);
nlohmann::json toJson(const domain::DisbursementPlan& plan);
nlohmann::json toJson(const domain::GovernanceConfig& config);

domain::Escrow escrowFromJson(const nlohmann::json& j);
domain::DisbursementPlan planFromJson(const nlohmann::json& j);
domain::GovernanceConfig governanceFromJson(const nlohmann::json& j);

domain::OptionType optionTypeFromString(const std::string& name);
domain::ExerciseStyle exerciseStyleFromString(const std::string& name);
domain::FeePolicy feePolicyFromString(const std::string& name);
domain::EscrowStatus escrowStatusFromString(const std::string& name);
domain::Outcome outcomeFromString(const std::string& name);
domain::Leg legFromString(const std::string& name);

}  // namespace escrow
