#include "shortmint/idgen/short_code_generator.h"

#include "shortmint/codec/base62.h"

namespace shortmint::idgen {

core::Result<std::string, MintError> DeterministicShortCodeGenerator::next_short_code() {
  const auto value = counter_.fetch_add(1, std::memory_order_relaxed);
  auto encoded = codec::encode_short_code(value);
  if (!encoded.has_value()) {
    return core::Result<std::string, MintError>::err(
        {MintErrorKind::kCodeSpaceExhausted, 0, "deterministic counter exhausted the code space"});
  }
  return core::Result<std::string, MintError>::ok(encoded.value());
}

}  // namespace shortmint::idgen
