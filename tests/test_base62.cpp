#include "shortmint/codec/base62.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace shortmint::codec;

// ── encode_short_code: fixed width ─────────────────────────────────────────

TEST_CASE("encode_short_code: zero pads to seven '0' symbols", "[codec][base62]") {
  const auto code = encode_short_code(0);
  REQUIRE(code.has_value());
  CHECK(code.value() == "0000000");
}

TEST_CASE("encode_short_code: digit 61 maps to 'z'", "[codec][base62]") {
  const auto code = encode_short_code(61);
  REQUIRE(code.has_value());
  CHECK(code.value() == "000000z");
}

TEST_CASE("encode_short_code: carries into the next position at 62", "[codec][base62]") {
  const auto code = encode_short_code(62);
  REQUIRE(code.has_value());
  CHECK(code.value() == "0000010");
}

TEST_CASE("encode_short_code: known mid-range value", "[codec][base62]") {
  // (1000 << 14) | (1 << 6) | 2
  const auto code = encode_short_code(16'384'066);
  REQUIRE(code.has_value());
  CHECK(code.value() == "0016kF8");
}

TEST_CASE("encode_short_code: largest encodable value is all 'z'", "[codec][base62]") {
  const auto code = encode_short_code(kShortCodeSpace - 1);
  REQUIRE(code.has_value());
  CHECK(code.value() == "zzzzzzz");
}

// ── encode_short_code: boundary policy ─────────────────────────────────────

TEST_CASE("encode_short_code: 62^7 is rejected as out of range", "[codec][base62][boundary]") {
  // 3,521,614,606,208 is a valid 42-bit value that needs an eighth symbol.
  const auto code = encode_short_code(3'521'614'606'208ULL);
  REQUIRE_FALSE(code.has_value());
  CHECK(code.error() == CodecError::kOutOfRange);
}

TEST_CASE("encode_short_code: maximum 42-bit value is rejected", "[codec][base62][boundary]") {
  const std::uint64_t max_42_bit = (std::uint64_t{1} << 42) - 1;
  const auto code = encode_short_code(max_42_bit);
  REQUIRE_FALSE(code.has_value());
  CHECK(code.error() == CodecError::kOutOfRange);
}

// ── decode_short_code ──────────────────────────────────────────────────────

TEST_CASE("decode_short_code: inverts encode across the domain", "[codec][base62]") {
  const std::uint64_t samples[] = {0,
                                   1,
                                   61,
                                   62,
                                   3843,
                                   3844,
                                   16'384'066,
                                   916'132'831,
                                   kShortCodeSpace / 2,
                                   kShortCodeSpace - 2,
                                   kShortCodeSpace - 1};

  for (const auto value : samples) {
    const auto code = encode_short_code(value);
    REQUIRE(code.has_value());
    const auto back = decode_short_code(code.value());
    REQUIRE(back.has_value());
    CHECK(back.value() == value);
  }
}

TEST_CASE("decode_short_code: parses symbols most significant first", "[codec][base62]") {
  const auto value = decode_short_code("0000010");
  REQUIRE(value.has_value());
  CHECK(value.value() == 62);

  const auto top = decode_short_code("zzzzzzz");
  REQUIRE(top.has_value());
  CHECK(top.value() == kShortCodeSpace - 1);
}

TEST_CASE("decode_short_code: wrong length is rejected", "[codec][base62]") {
  CHECK(decode_short_code("").error() == CodecError::kInvalidLength);
  CHECK(decode_short_code("000000").error() == CodecError::kInvalidLength);
  CHECK(decode_short_code("00000000").error() == CodecError::kInvalidLength);
}

TEST_CASE("decode_short_code: symbols outside the alphabet are rejected", "[codec][base62]") {
  CHECK(decode_short_code("000-000").error() == CodecError::kInvalidSymbol);
  CHECK(decode_short_code("abc def").error() == CodecError::kInvalidSymbol);
  CHECK(decode_short_code("000000_").error() == CodecError::kInvalidSymbol);
}

TEST_CASE("decode_short_code: case is significant", "[codec][base62]") {
  const auto upper = decode_short_code("000000A");
  const auto lower = decode_short_code("000000a");
  REQUIRE(upper.has_value());
  REQUIRE(lower.has_value());
  CHECK(upper.value() == 10);
  CHECK(lower.value() == 36);
}

TEST_CASE("codec_error_to_string: every error has a message", "[codec][base62]") {
  CHECK_FALSE(codec_error_to_string(CodecError::kOutOfRange).empty());
  CHECK_FALSE(codec_error_to_string(CodecError::kInvalidLength).empty());
  CHECK_FALSE(codec_error_to_string(CodecError::kInvalidSymbol).empty());
}
