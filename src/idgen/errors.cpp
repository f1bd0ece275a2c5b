#include "shortmint/idgen/errors.h"

namespace shortmint::idgen {

std::string mint_error_kind_to_string(MintErrorKind kind) {
  switch (kind) {
    case MintErrorKind::kClockRegression:
      return "clock_regression";
    case MintErrorKind::kWaitInterrupted:
      return "wait_interrupted";
    case MintErrorKind::kWaitTimedOut:
      return "wait_timed_out";
    case MintErrorKind::kOutsideEpochWindow:
      return "outside_epoch_window";
    case MintErrorKind::kCodeSpaceExhausted:
      return "code_space_exhausted";
  }
  return "unknown";
}

}  // namespace shortmint::idgen
