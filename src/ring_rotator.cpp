/// @file ring_rotator.cpp
/// @brief Non-template helpers of the ring rotator.

#include "ringrot/ring_rotator.h"

namespace ringrot {

const char* RotateStatusName(RotateStatus status) {
  switch (status) {
    case RotateStatus::kOk:
      return "ok";
    case RotateStatus::kEmptyArray:
      return "empty_array";
    case RotateStatus::kNotSquare:
      return "not_square";
  }
  return "unknown";
}

size_t RingSize(size_t n, size_t layer) {
  CHECK_GT(n, 0u);
  CHECK_LE(2 * layer, n - 1) << "layer " << layer << " outside table of side " << n;
  const size_t span = n - 1 - 2 * layer;
  return span == 0 ? 1 : 4 * span;
}

}  // namespace ringrot
