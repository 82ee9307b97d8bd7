// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// General purpose math routines

#pragma once

#include "eigen.h"

namespace rtcomp {

// Percentile q (0-100) of a set of values. Between two data points
// the result is linearly interpolated, i.e. the lowest value is the
// 0th percentile and the highest value the 100th percentile.
[[nodiscard]] auto percentile(const Eigen::ArrayXd& values,
                              const double q) -> double;

// Sorted copy of an array with duplicate values removed
[[nodiscard]] auto sortedUnique(const Eigen::ArrayXd& values)
  -> Eigen::ArrayXd;

// Round each element to a number of decimal places
[[nodiscard]] auto roundDecimals(const Eigen::ArrayXd& values,
                                 const int decimals) -> Eigen::ArrayXd;

// Values of a raster selected by a mask of the same shape, flattened
// in row-major order.
[[nodiscard]] auto maskedValues(const ArrayXXd& raster,
                                const ArrayXXb& mask) -> Eigen::ArrayXd;

} // namespace rtcomp
