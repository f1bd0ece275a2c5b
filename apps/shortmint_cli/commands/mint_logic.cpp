#include "mint_logic.h"

#include "shortmint/core/clock.h"
#include "shortmint/idgen/compact_id.h"

#include <string>

using shortmint::cli::MintCliConfig;

std::vector<shortmint::apps::Option<MintCliConfig>> mint_options() {
  return {
      {"--machine-id", true, "Machine id in [0, 255] (default: $SHORTMINT_MACHINE_ID or 1)",
       [](MintCliConfig& c, const std::string& v) {
         c.machine_id = v;
         return true;
       }},
      {"--count", true, "Number of codes to mint (default: 1)",
       [](MintCliConfig& c, const std::string& v) {
         const auto n = shortmint::cli::parse_int(v);
         if (!n.has_value()) {
           return false;
         }
         c.count = n.value();
         return true;
       }},
      {"--db", true, "Path to SQLite code registry (default: in-memory)",
       [](MintCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--max-attempts", true, "Mints per code before giving up on collisions (default: 8)",
       [](MintCliConfig& c, const std::string& v) {
         const auto n = shortmint::cli::parse_int(v);
         if (!n.has_value()) {
           return false;
         }
         c.max_attempts = n.value();
         return true;
       }},
  };
}

nlohmann::json allocated_code_to_json(const shortmint::app::AllocatedCode& allocated) {
  using shortmint::idgen::decode_compact_id;

  nlohmann::json j;
  j["code"] = allocated.code;
  j["collisions"] = allocated.collisions;
  j["reserved_at"] = allocated.reserved_at;

  const auto fields = decode_compact_id(allocated.code);
  if (fields.has_value()) {
    const auto& f = fields.value();
    j["id"] = shortmint::idgen::pack_compact_id(f);
    j["machine_id"] = f.machine_id;
    j["sequence"] = f.sequence;
    j["timestamp_offset"] = f.timestamp_offset;
    j["minted_at"] =
        shortmint::core::format_iso8601(shortmint::idgen::minted_unix_seconds(f));
  }
  return j;
}

int execute_mint(int count, shortmint::app::ShortCodeAllocator& allocator, std::ostream& out,
                 std::ostream& err) {
  for (int i = 0; i < count; ++i) {
    const auto result = allocator.allocate();
    if (!result.has_value()) {
      const auto& error = result.error();
      err << "Error: " << error.message;
      if (error.mint_error.has_value()) {
        err << " [" << shortmint::idgen::mint_error_kind_to_string(error.mint_error->kind) << "]";
      }
      err << "\n";
      return 1;
    }
    out << allocated_code_to_json(result.value()).dump() << "\n";
  }
  return 0;
}
