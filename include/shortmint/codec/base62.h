#pragma once

#include "shortmint/core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace shortmint::codec {

// Symbol order is part of the wire contract: digit 0 -> '0', digit 61 -> 'z'.
inline constexpr std::string_view kBase62Alphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
inline constexpr std::uint64_t kBase = 62;
inline constexpr std::size_t kShortCodeLength = 7;

// 62^7: number of distinct 7-character codes. Valid values are [0, kShortCodeSpace).
inline constexpr std::uint64_t kShortCodeSpace = 3'521'614'606'208ULL;
static_assert(kShortCodeSpace == kBase * kBase * kBase * kBase * kBase * kBase * kBase);

enum class CodecError {
  kOutOfRange,     // value >= 62^7, would not fit 7 characters
  kInvalidLength,  // code is not exactly 7 characters
  kInvalidSymbol,  // code contains a character outside the alphabet
};

[[nodiscard]] std::string codec_error_to_string(CodecError error);

// encode_short_code renders value as exactly kShortCodeLength base-62 symbols,
// most significant first, left-padded with '0'.
// Values outside [0, 62^7) are rejected rather than widened or truncated.
[[nodiscard]] core::Result<std::string, CodecError> encode_short_code(std::uint64_t value);

// decode_short_code is the inverse of encode_short_code.
[[nodiscard]] core::Result<std::uint64_t, CodecError> decode_short_code(std::string_view code);

}  // namespace shortmint::codec
