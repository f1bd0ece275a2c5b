#pragma once

#include "shortmint/core/result.h"

#include <optional>
#include <string>
#include <string_view>

namespace shortmint::cli {

// Environment variable consulted when --machine-id is absent.
inline constexpr const char* kMachineIdEnvVar = "SHORTMINT_MACHINE_ID";
inline constexpr int kDefaultMachineId = 1;
inline constexpr int kMaxMintCount = 10000;

// MintCliConfig holds parsed flags for `shortmint_cli mint`.
// Every field has an explicit default; optional fields mean "not configured".
struct MintCliConfig {
  // Raw --machine-id text; resolved (with the environment fallback) by resolve_machine_id.
  std::optional<std::string> machine_id;  // NOLINT(readability-identifier-naming)
  int count{1};                           // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;     // NOLINT(readability-identifier-naming)
  int max_attempts{8};                    // NOLINT(readability-identifier-naming)
};

// parse_int accepts an optional leading '-' followed by decimal digits, nothing else.
[[nodiscard]] std::optional<int> parse_int(std::string_view text);

// resolve_machine_id picks the machine id from, in order: the flag, the environment
// value, kDefaultMachineId. Only the syntax is checked here; range validation belongs
// to the generator so the same rule applies to every caller.
[[nodiscard]] core::Result<int, std::string> resolve_machine_id(
    const std::optional<std::string>& flag_value, const std::optional<std::string>& env_value);

// read_env returns the variable's value, or nullopt when unset or empty.
[[nodiscard]] std::optional<std::string> read_env(const char* name);

}  // namespace shortmint::cli
