/// @file table.cpp
/// @brief Implementation of the table view helpers.

#include "ringrot/table.h"

#include <iterator>

#include <fmt/format.h>

namespace ringrot {

ConstTableMap MapTable(const Table& table, size_t side) {
  CHECK_EQ(table.size(), side * side) << "table is not " << side << "x" << side;
  const auto dim = static_cast<Eigen::Index>(side);
  return ConstTableMap(table.data(), dim, dim);
}

std::vector<double> ExtractRing(const Table& table, size_t side, size_t layer) {
  CHECK_LT(2 * layer, side);
  const ConstTableMap grid = MapTable(table, side);
  const auto first = static_cast<Eigen::Index>(layer);
  const auto last = static_cast<Eigen::Index>(side - 1 - layer);

  if (first == last) {
    return {grid(first, first)};
  }

  std::vector<double> ring;
  ring.reserve(static_cast<size_t>(4 * (last - first)));
  for (Eigen::Index col = first; col <= last; ++col) {
    ring.push_back(grid(first, col));
  }
  for (Eigen::Index row = first + 1; row <= last; ++row) {
    ring.push_back(grid(row, last));
  }
  for (Eigen::Index col = last - 1; col >= first; --col) {
    ring.push_back(grid(last, col));
  }
  for (Eigen::Index row = last - 1; row > first; --row) {
    ring.push_back(grid(row, first));
  }
  return ring;
}

std::string FormatGrid(const Table& table, size_t side) {
  const ConstTableMap grid = MapTable(table, side);
  std::string out;
  for (Eigen::Index row = 0; row < grid.rows(); ++row) {
    out += '[';
    for (Eigen::Index col = 0; col < grid.cols(); ++col) {
      if (col > 0) {
        out += ", ";
      }
      fmt::format_to(std::back_inserter(out), "{}", grid(row, col));
    }
    out += "]\n";
  }
  return out;
}

}  // namespace ringrot
