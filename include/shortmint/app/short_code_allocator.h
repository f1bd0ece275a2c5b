#pragma once

#include "shortmint/core/clock.h"
#include "shortmint/core/result.h"
#include "shortmint/idgen/errors.h"
#include "shortmint/idgen/short_code_generator.h"
#include "shortmint/storage/code_registry.h"

#include <optional>
#include <string>

namespace shortmint::app {

struct AllocatedCode {
  std::string code;         // NOLINT(readability-identifier-naming)
  std::string reserved_at;  // NOLINT(readability-identifier-naming)
  int collisions{0};        // NOLINT(readability-identifier-naming)
};

enum class AllocationErrorKind {
  kMintFailed,           // generator returned an error; see mint_error
  kCollisionsExhausted,  // every attempt produced a code already in the registry
};

struct AllocationError {
  AllocationErrorKind kind{AllocationErrorKind::kMintFailed};  // NOLINT(readability-identifier-naming)
  int attempts{0};                                            // NOLINT(readability-identifier-naming)
  std::optional<idgen::MintError> mint_error;                 // NOLINT(readability-identifier-naming)
  std::string message;                                        // NOLINT(readability-identifier-naming)
};

// ShortCodeAllocator turns freshly minted codes into reserved codes.
//
// The generator guarantees uniqueness within one instance only. A collision here means
// another deployment shares the machine id, or the registry was seeded from elsewhere.
// Each collision triggers a fresh mint, up to max_attempts mints in total.
//
// Mint errors are returned immediately and never retried.
// References are borrowed; all three collaborators must outlive the allocator.
class ShortCodeAllocator {
 public:
  static constexpr int kDefaultMaxAttempts = 8;

  ShortCodeAllocator(idgen::IShortCodeGenerator& generator, storage::ICodeRegistry& registry,
                     core::IClock& clock, int max_attempts = kDefaultMaxAttempts);

  [[nodiscard]] core::Result<AllocatedCode, AllocationError> allocate();

 private:
  idgen::IShortCodeGenerator& generator_;
  storage::ICodeRegistry& registry_;
  core::IClock& clock_;
  int max_attempts_;
};

}  // namespace shortmint::app
