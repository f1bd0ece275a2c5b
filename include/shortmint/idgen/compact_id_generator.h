#pragma once

#include "shortmint/core/clock.h"
#include "shortmint/core/result.h"
#include "shortmint/idgen/compact_id.h"
#include "shortmint/idgen/errors.h"
#include "shortmint/idgen/short_code_generator.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace shortmint::idgen {

struct GeneratorOptions {
  // Interval between clock reads while waiting out an exhausted second.
  std::chrono::milliseconds poll_interval{10};  // NOLINT(readability-identifier-naming)
  // Upper bound on polling before giving up with kWaitTimedOut.
  std::chrono::milliseconds max_exhaustion_wait{5000};  // NOLINT(readability-identifier-naming)
};

// Point-in-time copy of generator state. Observational only.
struct GeneratorSnapshot {
  int machine_id{0};                          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> last_timestamp;  // NOLINT(readability-identifier-naming)
  int sequence{0};                            // NOLINT(readability-identifier-naming)
  std::uint64_t total_generated{0};           // NOLINT(readability-identifier-naming)
  std::uint64_t exhaustion_waits{0};          // NOLINT(readability-identifier-naming)
  std::uint64_t clock_regressions{0};         // NOLINT(readability-identifier-naming)
};

// CompactIdGenerator mints 42-bit identifiers for one machine id and renders them as
// 7-character base-62 short codes.
//
// Guarantees, per instance:
// - ids are strictly increasing across successive successful mints
// - at most 64 ids per wall-clock second; the 65th waits for the next second
// - a failed mint leaves state untouched
//
// Uniqueness across instances relies on operators assigning distinct machine ids.
// Nothing here detects two processes configured with the same one.
//
// The clock is borrowed, not owned: it must outlive the generator.
class CompactIdGenerator final : public IShortCodeGenerator {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<CompactIdGenerator>, ConfigurationError>
  create(int machine_id, core::IClock& clock, GeneratorOptions options = {});

  ~CompactIdGenerator() override = default;

  CompactIdGenerator(const CompactIdGenerator&) = delete;
  CompactIdGenerator& operator=(const CompactIdGenerator&) = delete;
  CompactIdGenerator(CompactIdGenerator&&) = delete;
  CompactIdGenerator& operator=(CompactIdGenerator&&) = delete;

  // Mint the next raw identifier. Serialized with every other mint on this instance.
  // May block for up to options.max_exhaustion_wait when the current second is exhausted.
  [[nodiscard]] core::Result<std::uint64_t, MintError> mint_id();

  // mint_id() rendered through codec::encode_short_code.
  [[nodiscard]] core::Result<std::string, MintError> next_short_code() override;

  [[nodiscard]] int machine_id() const { return machine_id_; }
  [[nodiscard]] GeneratorSnapshot snapshot() const;

 private:
  CompactIdGenerator(int machine_id, core::IClock& clock, GeneratorOptions options);

  // Poll until the clock strictly exceeds last_timestamp. Caller holds mutex_.
  [[nodiscard]] core::Result<std::int64_t, MintError> wait_for_next_second(
      std::int64_t last_timestamp);

  const int machine_id_;
  core::IClock& clock_;
  const GeneratorOptions options_;

  mutable std::mutex mutex_;
  std::optional<std::int64_t> last_timestamp_;
  int sequence_{0};
  std::uint64_t total_generated_{0};
  std::uint64_t exhaustion_waits_{0};
  std::uint64_t clock_regressions_{0};
};

}  // namespace shortmint::idgen
