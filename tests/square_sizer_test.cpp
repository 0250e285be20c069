/// @file square_sizer_test.cpp
/// @brief Tests for perfect-square detection.

#include "ringrot/square_sizer.h"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace {

void TestSmallValues() {
  assert(ringrot::SquareLen(0) == 0u);
  assert(ringrot::SquareLen(1) == 1u);
  assert(ringrot::SquareLen(4) == 2u);
  assert(ringrot::SquareLen(9) == 3u);
  assert(ringrot::SquareLen(16) == 4u);
  assert(ringrot::SquareLen(25) == 5u);

  for (size_t len : {2, 3, 5, 8, 10, 15, 24, 26, 99}) {
    assert(!ringrot::SquareLen(len).has_value());
  }

  std::printf("TestSmallValues: OK\n");
}

void TestExhaustiveRange() {
  // Every k * k maps back to k; everything strictly between two squares
  // has no side length.
  constexpr size_t kMaxSide = 3000;
  for (size_t k = 1; k <= kMaxSide; ++k) {
    auto side = ringrot::SquareLen(k * k);
    assert(side.has_value() && *side == k);
    for (size_t len = k * k + 1; len < (k + 1) * (k + 1); ++len) {
      assert(!ringrot::SquareLen(len).has_value());
    }
  }

  std::printf("TestExhaustiveRange: OK\n");
}

void TestLargeValues() {
  // Around 2^52 and above, a plain double sqrt can round the wrong way.
  for (uint64_t k : {67108863ull, 67108864ull, 67108865ull, 94906265ull,
                     3037000499ull, 4294967295ull}) {
    const size_t square = static_cast<size_t>(k) * static_cast<size_t>(k);
    auto side = ringrot::SquareLen(square);
    assert(side.has_value() && *side == k);
    assert(!ringrot::SquareLen(square - 1).has_value());
    if (square != std::numeric_limits<size_t>::max()) {
      assert(!ringrot::SquareLen(square + 1).has_value());
    }
  }

  assert(!ringrot::SquareLen(std::numeric_limits<size_t>::max()).has_value());

  std::printf("TestLargeValues: OK\n");
}

}  // namespace

int main() {
  static_assert(sizeof(size_t) >= 8, "tests assume a 64-bit size_t");

  TestSmallValues();
  TestExhaustiveRange();
  TestLargeValues();

  std::printf("\nAll square sizer tests passed!\n");
  return 0;
}
