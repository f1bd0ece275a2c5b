#include "startup_guard.h"

namespace shortmint::cli {

std::string validate_mint_config(const MintCliConfig& config) {
  if (config.count < 1 || config.count > kMaxMintCount) {
    return "Error: --count must be between 1 and " + std::to_string(kMaxMintCount) + ", got " +
           std::to_string(config.count);
  }

  if (config.max_attempts < 1) {
    return "Error: --max-attempts must be at least 1";
  }

  if (config.db_path.has_value() && config.db_path->empty()) {
    return "Error: --db requires a non-empty path.\n"
           "       Omit --db to run with an in-memory code registry.";
  }

  return "";
}

}  // namespace shortmint::cli
