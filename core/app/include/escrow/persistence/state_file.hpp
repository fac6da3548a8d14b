#pragma once

#include "escrow/error/escrow_error.hpp"

#include <optional>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// State files: whole-document reads and crash-safe rewrites
// -----------------------------------------------------------------------------
// Shared by JsonFileEscrowStore and the vault's optional state file.
//
// writeStateFile() writes "<path>.tmp" and renames it over <path>, so a
// crash leaves either the previous or the new document on disk, never a
// torn one. Failures throw EscrowError with the caller's `code`.
// -----------------------------------------------------------------------------

// nullopt when the file does not exist or cannot be opened.
std::optional<std::string> readStateFile(const std::string& path);

void writeStateFile(const std::string& path, const std::string& contents,
                    ErrorCode code);

}  // namespace escrow
