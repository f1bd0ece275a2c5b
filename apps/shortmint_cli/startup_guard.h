#pragma once

#include "config.h"
#include <string>

namespace shortmint::cli {

// validate_mint_config checks startup preconditions for `shortmint_cli mint`.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - count is within [1, kMaxMintCount]
// - max_attempts is at least 1
// - if db_path is present, it is non-empty
//
// Machine id range is not checked here: CompactIdGenerator::create owns that rule
// and reports it as a ConfigurationError.
[[nodiscard]] std::string validate_mint_config(const MintCliConfig& config);

}  // namespace shortmint::cli
