#include "decode_logic.h"

#include "shortmint/core/clock.h"
#include "shortmint/idgen/compact_id.h"

using shortmint::core::Result;
using shortmint::codec::CodecError;

Result<nlohmann::json, CodecError> short_code_to_json(std::string_view code) {
  const auto fields = shortmint::idgen::decode_compact_id(code);
  if (!fields.has_value()) {
    return Result<nlohmann::json, CodecError>::err(fields.error());
  }
  const auto& f = fields.value();

  nlohmann::json j;
  j["code"] = std::string(code);
  j["id"] = shortmint::idgen::pack_compact_id(f);
  j["machine_id"] = f.machine_id;
  j["minted_at"] = shortmint::core::format_iso8601(shortmint::idgen::minted_unix_seconds(f));
  j["sequence"] = f.sequence;
  j["timestamp_offset"] = f.timestamp_offset;
  return Result<nlohmann::json, CodecError>::ok(std::move(j));
}

nlohmann::json layout_to_json() {
  namespace idgen = shortmint::idgen;

  nlohmann::json bits;
  bits["machine_id"] = idgen::kMachineIdBits;
  bits["sequence"] = idgen::kSequenceBits;
  bits["timestamp"] = idgen::kTimestampBits;
  bits["total"] = idgen::kIdBits;

  nlohmann::json j;
  j["alphabet"] = std::string(shortmint::codec::kBase62Alphabet);
  j["bits"] = std::move(bits);
  j["code_length"] = shortmint::codec::kShortCodeLength;
  j["code_space"] = shortmint::codec::kShortCodeSpace;
  j["epoch"] = shortmint::core::format_iso8601(idgen::kEpochUnixSeconds);
  j["last_usable_second"] =
      shortmint::core::format_iso8601(idgen::kEpochUnixSeconds + idgen::kMaxTimestampOffset);
  j["max_ids_per_second"] = idgen::kMaxSequence + 1;
  j["max_machine_id"] = idgen::kMaxMachineId;
  return j;
}

int execute_decode(const std::vector<std::string>& codes, std::ostream& out, std::ostream& err) {
  int rc = 0;
  for (const auto& code : codes) {
    const auto decoded = short_code_to_json(code);
    if (!decoded.has_value()) {
      err << "Invalid short code '" << code
          << "': " << shortmint::codec::codec_error_to_string(decoded.error()) << "\n";
      rc = 1;
      continue;
    }
    out << decoded.value().dump() << "\n";
  }
  return rc;
}
