// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <Eigen/Dense>

// Per-pixel rasters (lines x samples) are stored row-major so that a
// line of an image is contiguous in memory, the same way the
// upstream imaging products are laid out. Spectra are 1D arrays
// (Eigen::ArrayXd) and linear algebra is done with the normal
// Eigen::Matrix classes.
using ArrayXXd =
  Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using ArrayXXb =
  Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Points on the unit circle, one (cos, sin) pair per row
using ArrayX2d = Eigen::Array<double, Eigen::Dynamic, 2, Eigen::RowMajor>;
