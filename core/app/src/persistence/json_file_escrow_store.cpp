#include "escrow/persistence/json_file_escrow_store.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/network/json_codec.hpp"
#include "escrow/persistence/state_file.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace escrow {

JsonFileEscrowStore::JsonFileEscrowStore(std::string path)
    : path_(std::move(path)) {
  const std::optional<std::string> text = readStateFile(path_);
  if (!text) {
    std::cout << "[JsonFileEscrowStore] no state at " << path_
              << ", starting empty\n";
    return;
  }

  try {
    const nlohmann::json root = nlohmann::json::parse(*text);
    if (root.contains("governance") && !root["governance"].is_null()) {
      book_.applyGovernance(governanceFromJson(root["governance"]));
    }
    book_.restoreRevision(root.value("revision", std::uint64_t{0}));

    if (root.contains("escrows")) {
      for (const nlohmann::json& entry : root.at("escrows")) {
        EscrowRecordBook::Record record;
        record.escrow_revision = entry.at("revision").get<std::uint64_t>();
        record.pending_revision =
            entry.value("pending_revision", std::uint64_t{0});

        domain::EscrowId id = 0;
        if (!entry.at("escrow").is_null()) {
          record.escrow = escrowFromJson(entry["escrow"]);
          id = record.escrow->id;
        }
        if (entry.contains("pending") && !entry["pending"].is_null()) {
          record.pending = planFromJson(entry["pending"]);
          id = record.pending->escrow_id;
        }
        if (id == 0) {
          throw EscrowError(ErrorCode::InvalidParameters,
                            "corrupt state file " + path_ +
                                ": record without escrow or plan");
        }
        book_.restore(id, std::move(record));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      "corrupt state file " + path_ + ": " + e.what());
  }

  std::cout << "[JsonFileEscrowStore] loaded " << book_.records().size()
            << " escrow record(s) up to revision " << book_.lastRevision()
            << " from " << path_ << "\n";
}

bool JsonFileEscrowStore::saveEscrow(const domain::Escrow& escrow,
                                     std::uint64_t revision) {
  std::lock_guard lock(mutex_);
  if (!book_.applyEscrow(escrow, revision)) {
    return false;
  }
  flush();
  return true;
}

std::vector<domain::Escrow> JsonFileEscrowStore::loadEscrows() {
  std::lock_guard lock(mutex_);
  return book_.escrows();
}

bool JsonFileEscrowStore::savePending(const domain::DisbursementPlan& plan,
                                      std::uint64_t revision) {
  std::lock_guard lock(mutex_);
  if (!book_.applyPending(plan, revision)) {
    return false;
  }
  flush();
  return true;
}

std::vector<domain::DisbursementPlan> JsonFileEscrowStore::loadPending() {
  std::lock_guard lock(mutex_);
  return book_.pending();
}

void JsonFileEscrowStore::saveGovernance(
    const domain::GovernanceConfig& config) {
  std::lock_guard lock(mutex_);
  if (book_.applyGovernance(config)) {
    flush();
  }
}

std::optional<domain::GovernanceConfig> JsonFileEscrowStore::loadGovernance() {
  std::lock_guard lock(mutex_);
  return book_.governance();
}

std::uint64_t JsonFileEscrowStore::lastRevision() {
  std::lock_guard lock(mutex_);
  return book_.lastRevision();
}

// -----------------------------------------------------------------------------
// flush(): serialize every record, then write-then-rename
// -----------------------------------------------------------------------------
void JsonFileEscrowStore::flush() {
  nlohmann::json root;
  root["revision"] = book_.lastRevision();
  root["governance"] =
      book_.governance() ? toJson(*book_.governance()) : nlohmann::json();
  root["escrows"] = nlohmann::json::array();
  for (const auto& [id, record] : book_.records()) {
    nlohmann::json entry;
    entry["revision"] = record.escrow_revision;
    entry["escrow"] = record.escrow ? toJson(*record.escrow) : nlohmann::json();
    entry["pending_revision"] = record.pending_revision;
    entry["pending"] =
        record.pending ? toJson(*record.pending) : nlohmann::json();
    root["escrows"].push_back(std::move(entry));
  }

  writeStateFile(path_, root.dump(2) + "\n", ErrorCode::InvalidParameters);
}

}  // namespace escrow
