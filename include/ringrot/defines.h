#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include <Eigen/Core>

#include <glog/logging.h>
#include <gflags/gflags.h>
#include <fmt/core.h>

namespace ringrot {

constexpr size_t kMaxGridLogSide = 16; // larger tables are not dumped at VLOG(2)

using Table = std::vector<double>;

using DoubleRowMat = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ConstTableMap = Eigen::Map<const DoubleRowMat>;

enum class RotateStatus {
    kOk,
    kEmptyArray, // zero elements
    kNotSquare,  // length is not n * n
};

} // namespace ringrot
