#pragma once

/// @file ring_rotator.h
/// @brief One-step clockwise rotation of every concentric ring of a square
///        table stored row-major in a flat buffer.
///
/// A table of side n has n / 2 rotating rings. Ring `layer` is the border of
/// the sub-square [layer, n - 1 - layer]^2 and holds 4 * (n - 1 - 2 * layer)
/// elements. The center cell of an odd table is never moved.

#include "ringrot/defines.h"
#include "ringrot/square_sizer.h"

#include <cstddef>
#include <vector>

namespace ringrot {

/// @brief Stable lowercase name of a status, for logs.
const char* RotateStatusName(RotateStatus status);

/// @brief Number of rotating rings in a table of side @p n.
inline size_t RingCount(size_t n) { return n / 2; }

/// @brief Number of cells on ring @p layer of a table of side @p n.
/// Returns 1 when the ring collapses to the center cell.
/// @pre layer <= (n - 1) / 2 and n > 0.
size_t RingSize(size_t n, size_t layer);

namespace detail {

/// @brief Flat index of (row, col) in a row-major table of side n.
inline size_t Idx(size_t n, size_t row, size_t col) { return row * n + col; }

/// @brief Shift ring @p layer of @p data one position clockwise.
///
/// Walks top row, right column, bottom row, left column carrying the value
/// displaced from the previous cell. The carry is seeded with the cell just
/// below the top-left corner, which is where the walk ends.
template <typename T>
void RotateRingClockwise(T* data, size_t n, size_t layer) {
  const size_t first = layer;
  const size_t last = n - 1 - layer;
  DCHECK_LT(first, last);

  T prev = data[Idx(n, first + 1, first)];

  // Top row: left to right.
  for (size_t col = first; col <= last; ++col) {
    T temp = data[Idx(n, first, col)];
    data[Idx(n, first, col)] = prev;
    prev = temp;
  }

  // Right column: below the corner to the bottom.
  for (size_t row = first + 1; row <= last; ++row) {
    T temp = data[Idx(n, row, last)];
    data[Idx(n, row, last)] = prev;
    prev = temp;
  }

  // Bottom row: right to left, corner excluded. Post-decrement so `col`
  // reaches first without wrapping.
  for (size_t col = last; col-- > first;) {
    T temp = data[Idx(n, last, col)];
    data[Idx(n, last, col)] = prev;
    prev = temp;
  }

  // Left column: bottom to top, both corners excluded.
  for (size_t row = last - 1; row > first; --row) {
    T temp = data[Idx(n, row, first)];
    data[Idx(n, row, first)] = prev;
    prev = temp;
  }
}

}  // namespace detail

/// @brief Rotate every ring of a flat square table one step clockwise.
///
/// The shape is checked before anything is written, so a failed call leaves
/// the buffer untouched.
///
/// @param data Row-major table of @p length elements, modified in place.
/// @param length Number of elements.
/// @return kEmptyArray when length is 0, kNotSquare when length is not a
///         perfect square, kOk otherwise. Tables of side 1 are left as is.
template <typename T>
RotateStatus RotateRight(T* data, size_t length) {
  if (length == 0) {
    return RotateStatus::kEmptyArray;
  }

  const std::optional<size_t> side = SquareLen(length);
  if (!side) {
    return RotateStatus::kNotSquare;
  }

  const size_t n = *side;
  if (n <= 1) {
    return RotateStatus::kOk;
  }

  CHECK(data != nullptr);
  for (size_t layer = 0; layer < RingCount(n); ++layer) {
    detail::RotateRingClockwise(data, n, layer);
  }
  return RotateStatus::kOk;
}

template <typename T>
RotateStatus RotateRight(std::vector<T>& data) {
  return RotateRight(data.data(), data.size());
}

}  // namespace ringrot
