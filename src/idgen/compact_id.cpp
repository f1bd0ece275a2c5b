#include "shortmint/idgen/compact_id.h"

namespace shortmint::idgen {

core::Result<CompactIdFields, codec::CodecError> decode_compact_id(std::string_view code) {
  const auto decoded = codec::decode_short_code(code);
  if (!decoded.has_value()) {
    return core::Result<CompactIdFields, codec::CodecError>::err(decoded.error());
  }
  return core::Result<CompactIdFields, codec::CodecError>::ok(unpack_compact_id(decoded.value()));
}

}  // namespace shortmint::idgen
