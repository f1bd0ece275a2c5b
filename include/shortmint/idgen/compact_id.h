#pragma once

#include "shortmint/codec/base62.h"
#include "shortmint/core/result.h"

#include <cstdint>
#include <string_view>

namespace shortmint::idgen {

// 42-bit compact identifier layout, most significant first:
//   [ 28 bits timestamp offset (s) | 8 bits machine id | 6 bits sequence ]
inline constexpr int kTimestampBits = 28;
inline constexpr int kMachineIdBits = 8;
inline constexpr int kSequenceBits = 6;
inline constexpr int kIdBits = kTimestampBits + kMachineIdBits + kSequenceBits;

inline constexpr int kMachineIdShift = kSequenceBits;
inline constexpr int kTimestampShift = kSequenceBits + kMachineIdBits;

inline constexpr int kMaxMachineId = (1 << kMachineIdBits) - 1;  // 255
inline constexpr int kMaxSequence = (1 << kSequenceBits) - 1;    // 63
inline constexpr std::uint64_t kTimestampMask = (std::uint64_t{1} << kTimestampBits) - 1;

// 2024-01-01T00:00:00Z
inline constexpr std::int64_t kEpochUnixSeconds = 1'704'067'200;

// Largest timestamp offset whose every (machine id, sequence) combination still encodes
// in 7 base-62 characters. 62^7 < 2^42, so the last ~1.7 years of the 28-bit window are
// not usable. Last usable second: 2030-10-23T18:11:36Z.
inline constexpr std::int64_t kMaxTimestampOffset =
    static_cast<std::int64_t>(codec::kShortCodeSpace >> kTimestampShift) - 1;
static_assert(kMaxTimestampOffset == 214'942'296);
static_assert(((static_cast<std::uint64_t>(kMaxTimestampOffset) << kTimestampShift) |
               ((std::uint64_t{1} << kTimestampShift) - 1)) < codec::kShortCodeSpace);

// Decoded fields of a compact identifier.
struct CompactIdFields {
  std::uint32_t timestamp_offset{0};  // NOLINT(readability-identifier-naming)
  int machine_id{0};                  // NOLINT(readability-identifier-naming)
  int sequence{0};                    // NOLINT(readability-identifier-naming)
  auto operator<=>(const CompactIdFields&) const = default;
};

[[nodiscard]] constexpr std::uint64_t pack_compact_id(const CompactIdFields& fields) {
  return (static_cast<std::uint64_t>(fields.timestamp_offset) << kTimestampShift) |
         (static_cast<std::uint64_t>(fields.machine_id) << kMachineIdShift) |
         static_cast<std::uint64_t>(fields.sequence);
}

[[nodiscard]] constexpr CompactIdFields unpack_compact_id(std::uint64_t id) {
  return CompactIdFields{
      static_cast<std::uint32_t>((id >> kTimestampShift) & kTimestampMask),
      static_cast<int>((id >> kMachineIdShift) & static_cast<std::uint64_t>(kMaxMachineId)),
      static_cast<int>(id & static_cast<std::uint64_t>(kMaxSequence)),
  };
}

// Unix seconds at which an identifier with these fields was minted.
[[nodiscard]] constexpr std::int64_t minted_unix_seconds(const CompactIdFields& fields) {
  return kEpochUnixSeconds + static_cast<std::int64_t>(fields.timestamp_offset);
}

// decode_compact_id parses a 7-character short code and splits it into its fields.
// Verification/diagnostic helper; minting never needs it.
[[nodiscard]] core::Result<CompactIdFields, codec::CodecError> decode_compact_id(
    std::string_view code);

}  // namespace shortmint::idgen
