/// @file square_sizer.cpp
/// @brief Implementation of SquareLen.

#include "ringrot/square_sizer.h"

#include <cmath>
#include <limits>

namespace ringrot {

namespace {

/// @brief floor(sqrt(value)) computed exactly.
///
/// The double estimate can be off by one for values above 2^52, so it is
/// nudged with integer comparisons. (n + 1) * (n + 1) <= value is tested as
/// n + 1 <= value / (n + 1) to stay clear of overflow.
size_t IntegerSqrt(size_t value) {
  constexpr size_t kMaxRoot =
      static_cast<size_t>(1) << (std::numeric_limits<size_t>::digits / 2);

  size_t n = static_cast<size_t>(std::sqrt(static_cast<double>(value)));
  if (n >= kMaxRoot) {
    n = kMaxRoot - 1;
  }
  while (n > 0 && n > value / n) {
    --n;
  }
  while (n + 1 <= value / (n + 1)) {
    ++n;
  }
  return n;
}

}  // anonymous namespace

std::optional<size_t> SquareLen(size_t length) {
  if (length == 0) {
    return 0;
  }

  const size_t n = IntegerSqrt(length);
  if (n * n == length) {
    return n;
  }
  return std::nullopt;
}

}  // namespace ringrot
