#include "shortmint/codec/base62.h"

#include <algorithm>
#include <optional>

namespace shortmint::codec {

namespace {

std::optional<std::uint64_t> symbol_value(char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<std::uint64_t>(c - '0');
  }
  if (c >= 'A' && c <= 'Z') {
    return static_cast<std::uint64_t>(c - 'A') + 10;
  }
  if (c >= 'a' && c <= 'z') {
    return static_cast<std::uint64_t>(c - 'a') + 36;
  }
  return std::nullopt;
}

}  // namespace

std::string codec_error_to_string(CodecError error) {
  switch (error) {
    case CodecError::kOutOfRange:
      return "value does not fit in 7 base-62 characters";
    case CodecError::kInvalidLength:
      return "short code must be exactly 7 characters";
    case CodecError::kInvalidSymbol:
      return "short code contains a character outside [0-9A-Za-z]";
  }
  return "unknown codec error";
}

core::Result<std::string, CodecError> encode_short_code(std::uint64_t value) {
  if (value >= kShortCodeSpace) {
    return core::Result<std::string, CodecError>::err(CodecError::kOutOfRange);
  }

  std::string code;
  code.reserve(kShortCodeLength);

  // Least significant digit first, then pad and reverse.
  while (value > 0) {
    code.push_back(kBase62Alphabet[value % kBase]);
    value /= kBase;
  }
  while (code.size() < kShortCodeLength) {
    code.push_back(kBase62Alphabet.front());
  }
  std::reverse(code.begin(), code.end());

  return core::Result<std::string, CodecError>::ok(std::move(code));
}

core::Result<std::uint64_t, CodecError> decode_short_code(std::string_view code) {
  if (code.size() != kShortCodeLength) {
    return core::Result<std::uint64_t, CodecError>::err(CodecError::kInvalidLength);
  }

  std::uint64_t value = 0;
  for (const char c : code) {
    const auto digit = symbol_value(c);
    if (!digit.has_value()) {
      return core::Result<std::uint64_t, CodecError>::err(CodecError::kInvalidSymbol);
    }
    value = value * kBase + digit.value();
  }

  return core::Result<std::uint64_t, CodecError>::ok(value);
}

}  // namespace shortmint::codec
