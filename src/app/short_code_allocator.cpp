#include "shortmint/app/short_code_allocator.h"

#include <algorithm>

namespace shortmint::app {

ShortCodeAllocator::ShortCodeAllocator(idgen::IShortCodeGenerator& generator,
                                       storage::ICodeRegistry& registry, core::IClock& clock,
                                       int max_attempts)
    : generator_(generator),
      registry_(registry),
      clock_(clock),
      max_attempts_(std::max(1, max_attempts)) {}

core::Result<AllocatedCode, AllocationError> ShortCodeAllocator::allocate() {
  using AllocateResult = core::Result<AllocatedCode, AllocationError>;

  int collisions = 0;
  for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
    const auto minted = generator_.next_short_code();
    if (!minted.has_value()) {
      return AllocateResult::err({AllocationErrorKind::kMintFailed, attempt, minted.error(),
                                  "mint failed: " + minted.error().message});
    }

    const std::string reserved_at = clock_.now_iso8601();
    if (registry_.reserve(minted.value(), reserved_at)) {
      return AllocateResult::ok({minted.value(), reserved_at, collisions});
    }
    ++collisions;
  }

  return AllocateResult::err({AllocationErrorKind::kCollisionsExhausted, max_attempts_,
                              std::nullopt,
                              "all " + std::to_string(max_attempts_) +
                                  " minted codes were already reserved"});
}

}  // namespace shortmint::app
