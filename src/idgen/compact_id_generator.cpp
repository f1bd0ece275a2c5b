#include "shortmint/idgen/compact_id_generator.h"

#include "shortmint/codec/base62.h"

namespace shortmint::idgen {

namespace {

using MintResult = core::Result<std::uint64_t, MintError>;
using WaitResult = core::Result<std::int64_t, MintError>;

}  // namespace

CompactIdGenerator::CompactIdGenerator(int machine_id, core::IClock& clock,
                                       GeneratorOptions options)
    : machine_id_(machine_id), clock_(clock), options_(options) {}

core::Result<std::shared_ptr<CompactIdGenerator>, ConfigurationError> CompactIdGenerator::create(
    int machine_id, core::IClock& clock, GeneratorOptions options) {
  using CreateResult = core::Result<std::shared_ptr<CompactIdGenerator>, ConfigurationError>;

  if (machine_id < 0 || machine_id > kMaxMachineId) {
    return CreateResult::err({machine_id, "machine id must be between 0 and " +
                                              std::to_string(kMaxMachineId) + ", got " +
                                              std::to_string(machine_id)});
  }
  if (options.poll_interval.count() <= 0) {
    return CreateResult::err({machine_id, "poll interval must be positive"});
  }

  return CreateResult::ok(
      std::shared_ptr<CompactIdGenerator>(new CompactIdGenerator(machine_id, clock, options)));
}

core::Result<std::uint64_t, MintError> CompactIdGenerator::mint_id() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t now = clock_.now_unix_seconds();

  if (last_timestamp_.has_value() && now < last_timestamp_.value()) {
    ++clock_regressions_;
    const std::int64_t diff = last_timestamp_.value() - now;
    return MintResult::err({MintErrorKind::kClockRegression, diff,
                            "clock moved backwards by " + std::to_string(diff) +
                                "s; refusing to generate id"});
  }

  int next_sequence = 0;
  if (last_timestamp_.has_value() && now == last_timestamp_.value()) {
    next_sequence = (sequence_ + 1) & kMaxSequence;
    if (next_sequence == 0) {
      // Sequence space for this second is exhausted.
      ++exhaustion_waits_;
      const auto waited = wait_for_next_second(last_timestamp_.value());
      if (!waited.has_value()) {
        return MintResult::err(waited.error());
      }
      now = waited.value();
    }
  }

  const std::int64_t offset = now - kEpochUnixSeconds;
  if (offset < 0 || offset > kMaxTimestampOffset) {
    return MintResult::err({MintErrorKind::kOutsideEpochWindow, 0,
                            "clock " + core::format_iso8601(now) +
                                " is outside the encodable window starting " +
                                core::format_iso8601(kEpochUnixSeconds)});
  }

  last_timestamp_ = now;
  sequence_ = next_sequence;
  ++total_generated_;

  return MintResult::ok(
      pack_compact_id({static_cast<std::uint32_t>(offset), machine_id_, sequence_}));
}

core::Result<std::int64_t, MintError> CompactIdGenerator::wait_for_next_second(
    std::int64_t last_timestamp) {
  const auto max_polls = options_.max_exhaustion_wait / options_.poll_interval;

  std::int64_t now = clock_.now_unix_seconds();
  for (std::int64_t polls = 0; now <= last_timestamp; ++polls) {
    if (polls >= max_polls) {
      return WaitResult::err(
          {MintErrorKind::kWaitTimedOut, 0,
           "clock did not advance past " + core::format_iso8601(last_timestamp) + " within " +
               std::to_string(options_.max_exhaustion_wait.count()) + "ms"});
    }
    if (!clock_.sleep_for(options_.poll_interval)) {
      return WaitResult::err({MintErrorKind::kWaitInterrupted, 0,
                              "interrupted while waiting for the next second after " +
                                  std::to_string(polls + 1) + " polls"});
    }
    now = clock_.now_unix_seconds();
    if (now < last_timestamp) {
      ++clock_regressions_;
      const std::int64_t diff = last_timestamp - now;
      return WaitResult::err({MintErrorKind::kClockRegression, diff,
                              "clock moved backwards by " + std::to_string(diff) +
                                  "s while waiting for the next second"});
    }
  }
  return WaitResult::ok(now);
}

core::Result<std::string, MintError> CompactIdGenerator::next_short_code() {
  const auto id = mint_id();
  if (!id.has_value()) {
    return core::Result<std::string, MintError>::err(id.error());
  }

  // Unreachable while mint_id enforces kMaxTimestampOffset.
  auto encoded = codec::encode_short_code(id.value());
  if (!encoded.has_value()) {
    return core::Result<std::string, MintError>::err(
        {MintErrorKind::kOutsideEpochWindow, 0, codec::codec_error_to_string(encoded.error())});
  }
  return core::Result<std::string, MintError>::ok(encoded.value());
}

GeneratorSnapshot CompactIdGenerator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return GeneratorSnapshot{machine_id_,       last_timestamp_,   sequence_, total_generated_,
                           exhaustion_waits_, clock_regressions_};
}

}  // namespace shortmint::idgen
