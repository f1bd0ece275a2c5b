#pragma once

#include "shortmint/codec/base62.h"
#include "shortmint/core/result.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// short_code_to_json: decode a 7-character code into id, timestamp_offset,
// minted_at, machine_id and sequence.
[[nodiscard]] shortmint::core::Result<nlohmann::json, shortmint::codec::CodecError>
short_code_to_json(std::string_view code);

// layout_to_json: bit layout, epoch and the last second whose codes fit 7 characters.
[[nodiscard]] nlohmann::json layout_to_json();

// execute_decode: print one JSON line per code; invalid codes are reported on `err`
// and make the return value 1, but do not stop the remaining codes from printing.
int execute_decode(const std::vector<std::string>& codes, std::ostream& out, std::ostream& err);
