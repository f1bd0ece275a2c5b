#include "shortmint/codec/base62.h"
#include "shortmint/core/clock.h"
#include "shortmint/idgen/compact_id.h"

#include <catch2/catch_test_macros.hpp>

using namespace shortmint;

TEST_CASE("compact id layout: 28 + 8 + 6 bits", "[idgen][layout]") {
  CHECK(idgen::kIdBits == 42);
  CHECK(idgen::kTimestampShift == 14);
  CHECK(idgen::kMachineIdShift == 6);
  CHECK(idgen::kMaxMachineId == 255);
  CHECK(idgen::kMaxSequence == 63);
}

TEST_CASE("compact id layout: epoch is 2024-01-01T00:00:00Z", "[idgen][layout]") {
  CHECK(core::format_iso8601(idgen::kEpochUnixSeconds) == "2024-01-01T00:00:00Z");
}

TEST_CASE("compact id layout: encodable window ends 2030-10-23T18:11:36Z", "[idgen][layout]") {
  CHECK(core::format_iso8601(idgen::kEpochUnixSeconds + idgen::kMaxTimestampOffset) ==
        "2030-10-23T18:11:36Z");

  // Highest id the generator can emit still fits 7 symbols.
  const auto highest = idgen::pack_compact_id(
      {static_cast<std::uint32_t>(idgen::kMaxTimestampOffset), 255, 63});
  const auto code = codec::encode_short_code(highest);
  REQUIRE(code.has_value());
  CHECK(code.value() == "zzzzwpr");

  // One second later the top of the range no longer does.
  const auto beyond = idgen::pack_compact_id(
      {static_cast<std::uint32_t>(idgen::kMaxTimestampOffset + 1), 255, 63});
  CHECK_FALSE(codec::encode_short_code(beyond).has_value());
}

TEST_CASE("pack_compact_id: places fields at their shifts", "[idgen][layout]") {
  CHECK(idgen::pack_compact_id({0, 0, 0}) == 0);
  CHECK(idgen::pack_compact_id({0, 0, 63}) == 63);
  CHECK(idgen::pack_compact_id({0, 1, 0}) == 64);
  CHECK(idgen::pack_compact_id({1, 0, 0}) == 16384);
  CHECK(idgen::pack_compact_id({1000, 1, 2}) == 16'384'066);
}

TEST_CASE("unpack_compact_id: recovers every field", "[idgen][layout]") {
  const idgen::CompactIdFields fields{123'456, 200, 17};
  CHECK(idgen::unpack_compact_id(idgen::pack_compact_id(fields)) == fields);
}

TEST_CASE("decode_compact_id: splits a short code into fields", "[idgen][layout]") {
  const auto fields = idgen::decode_compact_id("0016kF8");
  REQUIRE(fields.has_value());
  CHECK(fields.value().timestamp_offset == 1000);
  CHECK(fields.value().machine_id == 1);
  CHECK(fields.value().sequence == 2);
  CHECK(idgen::minted_unix_seconds(fields.value()) == idgen::kEpochUnixSeconds + 1000);
}

TEST_CASE("decode_compact_id: propagates codec errors", "[idgen][layout]") {
  const auto fields = idgen::decode_compact_id("short");
  REQUIRE_FALSE(fields.has_value());
  CHECK(fields.error() == codec::CodecError::kInvalidLength);
}
