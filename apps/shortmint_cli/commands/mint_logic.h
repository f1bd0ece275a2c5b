#pragma once

#include "shortmint/app/short_code_allocator.h"

#include <nlohmann/json.hpp>

#include "config.h"
#include "shared/arg_parser.h"
#include <ostream>
#include <vector>

// mint_options: flags accepted by `shortmint_cli mint`.
// --count and --max-attempts reject values that are not decimal integers; range checks
// are left to validate_mint_config.
[[nodiscard]] std::vector<shortmint::apps::Option<shortmint::cli::MintCliConfig>> mint_options();

// allocated_code_to_json: one JSON object per code with its decoded fields.
// Keys are sorted alphabetically (nlohmann::json uses std::map internally).
[[nodiscard]] nlohmann::json allocated_code_to_json(const shortmint::app::AllocatedCode& allocated);

// execute_mint: allocate `count` codes and write them to `out` as JSON lines.
// Stops at the first failure, reports it on `err` and returns 1.
// The allocator is built by the caller; this TU never names a concrete generator or registry.
int execute_mint(int count, shortmint::app::ShortCodeAllocator& allocator, std::ostream& out,
                 std::ostream& err);
