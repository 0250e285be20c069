#pragma once

/// @file square_sizer.h
/// @brief Perfect-square detection for flat table lengths.

#include <cstddef>
#include <optional>

namespace ringrot {

/// @brief Side length of a square table holding @p length elements.
///
/// Returns 0 for an empty table, n when n * n == length, and no value
/// otherwise. Exact over the whole size_t range.
std::optional<size_t> SquareLen(size_t length);

}  // namespace ringrot
