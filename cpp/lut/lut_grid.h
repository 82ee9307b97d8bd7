// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Construction of LUT grids from the range or the distribution of
// the data that the LUT needs to cover. A grid that would be too
// dense, or a spacing of 0, means that no grid is used and the
// caller uses a single point instead (std::nullopt is returned).

#pragma once

#include <common/eigen.h>
#include <optional>
#include <string>

namespace rtcomp {

enum class AngleUnit
{
    degrees,
    radians,
};

// "d" or "degrees", "r" or "radians"
[[nodiscard]] auto angleUnitFromString(const std::string& unit) -> AngleUnit;

// Evenly spaced grid from min_val to max_val with at most the given
// spacing. Throws std::invalid_argument if that takes more than
// lut::max_grid_points points. The grid points are rounded to 4 decimals if min_spacing
// is larger than 1e-4. Returns std::nullopt if spacing is 0, if only
// one grid point results, or if the actual spacing is less than
// min_spacing.
[[nodiscard]] auto getGrid(const double min_val,
                           const double max_val,
                           const double spacing,
                           const double min_spacing)
  -> std::optional<Eigen::ArrayXd>;

// Evenly strided subset of at most lut::max_cluster_samples rows
// that includes the first and the last row. A single point is
// duplicated so that a covariance can be estimated.
[[nodiscard]] auto clusterSamples(const ArrayX2d& points) -> ArrayX2d;

// Grid or center point of circular data. Angles may be given in any
// convention (e.g. 0 to 360 or -180 to 180 degrees); they are
// wrapped into [0, 360) first and a grid that does not cross 0
// degrees is in that range. With spacing equal to
// lut::centerpoint (-1) the representative angle of the data is
// returned as an array of one element. Otherwise, if the data
// occupy at most two quadrants of the circle, a linear grid between
// the extreme angles is constructed, taking care of data crossing
// the 0/360 degree line. If the spread of the data is larger,
// representative angles are found by clustering the data on the
// unit circle. The result is in degrees regardless of the input
// unit.
[[nodiscard]] auto getAngularGrid(const Eigen::ArrayXd& angles,
                                  const double spacing,
                                  const double min_spacing,
                                  const AngleUnit unit = AngleUnit::degrees)
  -> std::optional<Eigen::ArrayXd>;

// Representative angle of circular data in degrees (center point
// mode of getAngularGrid)
[[nodiscard]] auto angularCenter(const Eigen::ArrayXd& angles,
                                 const AngleUnit unit = AngleUnit::degrees)
  -> double;

} // namespace rtcomp
