#pragma once

#include "shortmint/core/result.h"
#include "shortmint/idgen/errors.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace shortmint::idgen {

// Abstract short-code generator interface for dependency injection.
// Allows production code to use the compact time-based generator while tests/demos
// use deterministic codes.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IShortCodeGenerator {
 public:
  virtual ~IShortCodeGenerator() = default;

  // Mint the next short code.
  // Contract: on success the code is exactly 7 characters of [0-9A-Za-z].
  [[nodiscard]] virtual core::Result<std::string, MintError> next_short_code() = 0;

 protected:
  IShortCodeGenerator() = default;
  IShortCodeGenerator(const IShortCodeGenerator&) = default;
  IShortCodeGenerator& operator=(const IShortCodeGenerator&) = default;
  IShortCodeGenerator(IShortCodeGenerator&&) = default;
  IShortCodeGenerator& operator=(IShortCodeGenerator&&) = default;
};

// Deterministic generator: encodes a sequential counter, no clock.
// For tests and demos where reproducible output is required.
// Thread-safe. Same sequence of calls produces same codes: "0000000", "0000001", ...
class DeterministicShortCodeGenerator final : public IShortCodeGenerator {
 public:
  explicit DeterministicShortCodeGenerator(std::uint64_t start = 0) : counter_(start) {}
  ~DeterministicShortCodeGenerator() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicShortCodeGenerator(const DeterministicShortCodeGenerator&) = delete;
  DeterministicShortCodeGenerator& operator=(const DeterministicShortCodeGenerator&) = delete;
  DeterministicShortCodeGenerator(DeterministicShortCodeGenerator&&) = delete;
  DeterministicShortCodeGenerator& operator=(DeterministicShortCodeGenerator&&) = delete;

  [[nodiscard]] core::Result<std::string, MintError> next_short_code() override;

 private:
  std::atomic<std::uint64_t> counter_;
};

}  // namespace shortmint::idgen
