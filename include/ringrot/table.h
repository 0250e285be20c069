#pragma once

/// @file table.h
/// @brief Read-only 2-D view of a flat square table.

#include "ringrot/defines.h"

#include <cstddef>
#include <string>
#include <vector>

namespace ringrot {

/// @brief Map a row-major flat table as a side x side matrix.
/// @pre table.size() == side * side.
ConstTableMap MapTable(const Table& table, size_t side);

/// @brief Values of ring @p layer in clockwise order, starting at the ring's
///        top-left corner.
///
/// Returns the single center value when the ring collapses to one cell.
/// @pre 2 * layer < side.
std::vector<double> ExtractRing(const Table& table, size_t side, size_t layer);

/// @brief Multi-line rendering of the table, one row per line.
std::string FormatGrid(const Table& table, size_t side);

}  // namespace ringrot
