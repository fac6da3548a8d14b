#pragma once

#include <stdexcept>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// ErrorCode — every way an escrow or governance operation can fail
// -----------------------------------------------------------------------------
//
// @brief  Machine-readable failure kind carried by EscrowError.
//
// @details
// Callers branch on the code, not on the message. Two groups matter to
// client tooling:
//
//   Retryable     VaultError, StaleGovernanceConfig. The same request may
//                 succeed later; resubmitting is safe because the escrow
//                 status check rejects anything already completed.
//
//   Permanent     Everything else. The request will never succeed against
//                 the current escrow state or inputs.
//
// Every failure leaves the escrow and governance state exactly as it was
// before the call.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidParameters,
  Unauthorized,
  InvalidState,
  AlreadySettled,
  NotExpired,
  Expired,
  NotITM,
  NotAmerican,
  InsufficientCollateral,
  IncorrectCollateralAsset,
  FeeRateOutOfBounds,
  ArithmeticOverflow,
  StaleGovernanceConfig,
  EscrowNotFound,
  VaultError,
};

inline const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidParameters:        return "InvalidParameters";
    case ErrorCode::Unauthorized:             return "Unauthorized";
    case ErrorCode::InvalidState:             return "InvalidState";
    case ErrorCode::AlreadySettled:           return "AlreadySettled";
    case ErrorCode::NotExpired:               return "NotExpired";
    case ErrorCode::Expired:                  return "Expired";
    case ErrorCode::NotITM:                   return "NotITM";
    case ErrorCode::NotAmerican:              return "NotAmerican";
    case ErrorCode::InsufficientCollateral:   return "InsufficientCollateral";
    case ErrorCode::IncorrectCollateralAsset: return "IncorrectCollateralAsset";
    case ErrorCode::FeeRateOutOfBounds:       return "FeeRateOutOfBounds";
    case ErrorCode::ArithmeticOverflow:       return "ArithmeticOverflow";
    case ErrorCode::StaleGovernanceConfig:    return "StaleGovernanceConfig";
    case ErrorCode::EscrowNotFound:           return "EscrowNotFound";
    case ErrorCode::VaultError:               return "VaultError";
  }
  return "Unknown";
}

inline bool isRetryable(ErrorCode code) {
  return code == ErrorCode::VaultError ||
         code == ErrorCode::StaleGovernanceConfig;
}

// -----------------------------------------------------------------------------
// EscrowError
// -----------------------------------------------------------------------------
//
// @brief  The single exception type thrown by the engine, the governance
//         component and ICollateralVault implementations.
//
// @details
// what() holds a human-readable message for logs; code() is what callers
// should inspect. The command layer (EscrowEngine::executeCommand) turns
// an EscrowError into {"status":"error","error":"<code>",...}.
// -----------------------------------------------------------------------------
class EscrowError : public std::runtime_error {
 public:
  EscrowError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace escrow
