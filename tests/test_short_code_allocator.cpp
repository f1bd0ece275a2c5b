#include "shortmint/app/short_code_allocator.h"
#include "shortmint/codec/base62.h"
#include "shortmint/core/clock.h"
#include "shortmint/idgen/compact_id.h"
#include "shortmint/idgen/compact_id_generator.h"
#include "shortmint/idgen/short_code_generator.h"
#include "shortmint/storage/code_registry.h"

#include <catch2/catch_test_macros.hpp>

using namespace shortmint;

namespace {

constexpr std::int64_t kT0 = idgen::kEpochUnixSeconds + 1000;

}  // namespace

TEST_CASE("allocate: first free code is reserved", "[app][allocator]") {
  idgen::DeterministicShortCodeGenerator gen;
  storage::InMemoryCodeRegistry registry;
  core::ManualClock clock(kT0);
  app::ShortCodeAllocator allocator(gen, registry, clock);

  const auto result = allocator.allocate();
  REQUIRE(result.has_value());
  CHECK(result.value().code == "0000000");
  CHECK(result.value().collisions == 0);
  CHECK(result.value().reserved_at == "2024-01-01T00:16:40Z");
  CHECK(registry.contains("0000000"));
}

TEST_CASE("allocate: collisions trigger a fresh mint", "[app][allocator]") {
  idgen::DeterministicShortCodeGenerator gen;
  storage::InMemoryCodeRegistry registry;
  core::ManualClock clock(kT0);
  REQUIRE(registry.reserve("0000000", "seeded"));
  REQUIRE(registry.reserve("0000001", "seeded"));

  app::ShortCodeAllocator allocator(gen, registry, clock);
  const auto result = allocator.allocate();
  REQUIRE(result.has_value());
  CHECK(result.value().code == "0000002");
  CHECK(result.value().collisions == 2);
  CHECK(registry.count() == 3);
}

TEST_CASE("allocate: gives up after max_attempts collisions", "[app][allocator]") {
  idgen::DeterministicShortCodeGenerator gen;
  storage::InMemoryCodeRegistry registry;
  core::ManualClock clock(kT0);
  REQUIRE(registry.reserve("0000000", "seeded"));
  REQUIRE(registry.reserve("0000001", "seeded"));

  app::ShortCodeAllocator allocator(gen, registry, clock, 2);
  const auto result = allocator.allocate();
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == app::AllocationErrorKind::kCollisionsExhausted);
  CHECK(result.error().attempts == 2);
  CHECK_FALSE(result.error().mint_error.has_value());
  CHECK(registry.count() == 2);
}

TEST_CASE("allocate: mint errors are returned without retry", "[app][allocator]") {
  core::ManualClock clock(idgen::kEpochUnixSeconds - 10);
  auto gen_result = idgen::CompactIdGenerator::create(1, clock);
  REQUIRE(gen_result.has_value());
  auto gen = gen_result.value();
  storage::InMemoryCodeRegistry registry;

  app::ShortCodeAllocator allocator(*gen, registry, clock);
  const auto result = allocator.allocate();
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == app::AllocationErrorKind::kMintFailed);
  CHECK(result.error().attempts == 1);
  REQUIRE(result.error().mint_error.has_value());
  CHECK(result.error().mint_error->kind == idgen::MintErrorKind::kOutsideEpochWindow);
  CHECK(registry.count() == 0);
}

TEST_CASE("allocate: duplicate machine ids collide and are resolved by re-minting",
          "[app][allocator]") {
  // Two deployments misconfigured with the same machine id, sharing one registry.
  core::ManualClock clock(kT0);
  auto a = idgen::CompactIdGenerator::create(7, clock);
  auto b = idgen::CompactIdGenerator::create(7, clock);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  storage::InMemoryCodeRegistry registry;

  app::ShortCodeAllocator alloc_a(*a.value(), registry, clock);
  app::ShortCodeAllocator alloc_b(*b.value(), registry, clock);

  const auto first = alloc_a.allocate();
  const auto second = alloc_b.allocate();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());

  CHECK(first.value().collisions == 0);
  CHECK(second.value().collisions == 1);
  CHECK(first.value().code != second.value().code);

  const auto fields = idgen::decode_compact_id(second.value().code);
  REQUIRE(fields.has_value());
  CHECK(fields.value().machine_id == 7);
  CHECK(fields.value().sequence == 1);
}

TEST_CASE("allocate: max_attempts below one is treated as one", "[app][allocator]") {
  idgen::DeterministicShortCodeGenerator gen;
  storage::InMemoryCodeRegistry registry;
  core::ManualClock clock(kT0);
  REQUIRE(registry.reserve("0000000", "seeded"));

  app::ShortCodeAllocator allocator(gen, registry, clock, 0);
  const auto result = allocator.allocate();
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().attempts == 1);
}

TEST_CASE("DeterministicShortCodeGenerator: sequential codes", "[idgen][deterministic]") {
  idgen::DeterministicShortCodeGenerator gen(61);
  CHECK(gen.next_short_code().value() == "000000z");
  CHECK(gen.next_short_code().value() == "0000010");
}

TEST_CASE("DeterministicShortCodeGenerator: counter past the code space is exhausted",
          "[idgen][deterministic]") {
  idgen::DeterministicShortCodeGenerator gen(codec::kShortCodeSpace - 1);
  CHECK(gen.next_short_code().value() == "zzzzzzz");

  const auto exhausted = gen.next_short_code();
  REQUIRE_FALSE(exhausted.has_value());
  CHECK(exhausted.error().kind == idgen::MintErrorKind::kCodeSpaceExhausted);
  CHECK(idgen::mint_error_kind_to_string(exhausted.error().kind) == "code_space_exhausted");
}
