#pragma once

#include <cstdint>
#include <string>

namespace shortmint::idgen {

// ConfigurationError: the generator could not be constructed.
// Fatal at startup; never retried.
struct ConfigurationError {
  int machine_id{0};     // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

enum class MintErrorKind {
  kClockRegression,     // wall clock went backwards relative to the last mint
  kWaitInterrupted,     // clock reported an interrupted sleep during the exhaustion wait
  kWaitTimedOut,        // clock did not advance within the exhaustion wait bound
  kOutsideEpochWindow,  // clock precedes the epoch or is past the encodable window
  kCodeSpaceExhausted,  // counter-based generator ran past 62^7 codes
};

// MintError: no identifier was emitted and generator state is unchanged.
struct MintError {
  MintErrorKind kind{MintErrorKind::kClockRegression};  // NOLINT(readability-identifier-naming)
  // Set for kClockRegression: how far (in seconds) the clock moved backwards.
  std::int64_t regression_seconds{0};  // NOLINT(readability-identifier-naming)
  std::string message;                 // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string mint_error_kind_to_string(MintErrorKind kind);

}  // namespace shortmint::idgen
