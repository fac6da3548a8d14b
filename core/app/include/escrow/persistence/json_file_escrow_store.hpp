#pragma once

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"
#include "escrow/persistence/escrow_record_book.hpp"
#include "escrow/persistence/i_escrow_store.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// JsonFileEscrowStore — IEscrowStore backed by one JSON document
// -----------------------------------------------------------------------------
//
// @brief  Keeps escrow, pending-disbursement and governance records across
//         daemon restarts.
//
// @details
// File layout:
//   {
//     "revision": <highest accepted revision>,
//     "governance": {...} | null,
//     "escrows": [
//       {"revision": r, "escrow": {...} | null,
//        "pending_revision": p, "pending": {...} | null}, ...
//     ]
//   }
// Escrows, plans and governance use the command protocol's field names
// (json_codec).
//
// The constructor reads the file if it exists. Every applied save
// rewrites the whole document through writeStateFile(); a stale save
// (see EscrowRecordBook) leaves the file untouched.
//
// Thread-safety: one mutex around the cached records and the file write.
// -----------------------------------------------------------------------------
class JsonFileEscrowStore : public IEscrowStore {
 public:
  // @throws EscrowError(InvalidParameters) if the file exists but cannot
  //         be parsed.
  explicit JsonFileEscrowStore(std::string path);

  bool saveEscrow(const domain::Escrow& escrow,
                  std::uint64_t revision) override;
  std::vector<domain::Escrow> loadEscrows() override;
  bool savePending(const domain::DisbursementPlan& plan,
                   std::uint64_t revision) override;
  std::vector<domain::DisbursementPlan> loadPending() override;
  void saveGovernance(const domain::GovernanceConfig& config) override;
  std::optional<domain::GovernanceConfig> loadGovernance() override;
  std::uint64_t lastRevision() override;

  const std::string& path() const { return path_; }

 private:
  // Caller holds mutex_.
  // @throws EscrowError(InvalidParameters) if the file cannot be written.
  void flush();

  std::string path_;
  std::mutex mutex_;
  EscrowRecordBook book_;
};

}  // namespace escrow
