#include "escrow/persistence/state_file.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace escrow {

std::optional<std::string> readStateFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// -----------------------------------------------------------------------------
// writeStateFile: write-then-rename
// -----------------------------------------------------------------------------
void writeStateFile(const std::string& path, const std::string& contents,
                    ErrorCode code) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw EscrowError(code, "cannot write state file " + tmp);
    }
    out << contents;
    out.flush();
    if (!out) {
      throw EscrowError(code, "short write to state file " + tmp);
    }
  }

  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::cerr << "[StateFile] ERROR: rename " << tmp << " -> " << path
              << " failed\n";
    throw EscrowError(code, "cannot replace state file " + path);
  }
}

}  // namespace escrow
