#include "mint.h"

#include "shortmint/app/short_code_allocator.h"
#include "shortmint/core/clock.h"
#include "shortmint/core/version.h"
#include "shortmint/idgen/compact_id_generator.h"
#include "shortmint/storage/code_registry.h"
#include "shortmint/storage/sqlite/sqlite_code_registry.h"
#include "shortmint/storage/sqlite/sqlite_db.h"

#include "config.h"
#include "mint_logic.h"
#include "shared/arg_parser.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

// Open DB, apply schema v1, and wrap it in a registry; on failure print the error and return nullptr.
std::unique_ptr<shortmint::storage::ICodeRegistry> open_registry(const std::string& path) {
  auto db_result = shortmint::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return nullptr;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return nullptr;
  }
  return std::make_unique<shortmint::storage::sqlite::SqliteCodeRegistry>(db);
}

}  // namespace

int cmd_mint(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = mint_options();
  auto parsed = shortmint::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok() || !parsed.positionals.empty()) {
    for (const auto& e : parsed.errors) {
      std::cerr << e << "\n";
    }
    for (const auto& p : parsed.positionals) {
      std::cerr << "Unexpected argument: " << p << "\n";
    }
    std::cerr << "Usage: shortmint_cli mint [options]\n" << shortmint::apps::format_usage(options);
    return 1;
  }
  const auto& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = shortmint::cli::validate_mint_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const auto machine_id = shortmint::cli::resolve_machine_id(
      config.machine_id, shortmint::cli::read_env(shortmint::cli::kMachineIdEnvVar));
  if (!machine_id.has_value()) {
    std::cerr << machine_id.error() << "\n";
    return 1;
  }

  shortmint::core::SystemClock clock;
  const auto generator_result =
      shortmint::idgen::CompactIdGenerator::create(machine_id.value(), clock);
  if (!generator_result.has_value()) {
    std::cerr << "Configuration error: " << generator_result.error().message << "\n";
    return 1;
  }
  auto generator = generator_result.value();

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "shortmint v" << shortmint::core::kBuildVersion << "\n";
  std::cerr << "Machine id:  " << generator->machine_id() << "\n";

  std::unique_ptr<shortmint::storage::ICodeRegistry> registry;
  if (config.db_path.has_value()) {
    registry = open_registry(config.db_path.value());
    if (!registry) {
      return 1;
    }
    std::cerr << "Registry:    SQLite -- " << config.db_path.value() << "\n";
  } else {
    registry = std::make_unique<shortmint::storage::InMemoryCodeRegistry>();
    std::cerr << "WARNING: No --db path specified. Collision re-check uses an EPHEMERAL\n"
                 "         in-memory registry that only sees codes from this run.\n";
  }
  // ─────────────────────────────────────────────────────────────────────────

  shortmint::app::ShortCodeAllocator allocator(*generator, *registry, clock, config.max_attempts);

  int rc = 0;
  try {
    rc = execute_mint(config.count, allocator, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: code registry failure: " << e.what() << "\n";
    return 1;
  }

  const auto stats = generator->snapshot();
  std::cerr << "Minted:      " << stats.total_generated << " (exhaustion waits: "
            << stats.exhaustion_waits << ", clock regressions: " << stats.clock_regressions
            << ")\n";
  return rc;
}
