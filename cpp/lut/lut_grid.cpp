// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "lut_grid.h"

#include "circular_mixture.h"

#include <common/algorithm.h>
#include <common/constants.h>
#include <common/io.h>

#include <cmath>
#include <spdlog/spdlog.h>

namespace rtcomp {

auto angleUnitFromString(const std::string& unit) -> AngleUnit
{
    const std::string unit_l { lower(unit) };
    if (unit_l == "d" || unit_l == "degrees") {
        return AngleUnit::degrees;
    }
    if (unit_l == "r" || unit_l == "radians") {
        return AngleUnit::radians;
    }
    throw std::invalid_argument { "unknown angle unit: " + unit
                                  + "; must be one of: d, degrees, r, "
                                    "radians" };
}

auto getGrid(const double min_val,
             const double max_val,
             const double spacing,
             const double min_spacing) -> std::optional<Eigen::ArrayXd>
{
    if (spacing == 0.0) {
        spdlog::debug("Grid spacing set at 0, using no grid.");
        return std::nullopt;
    }
    if (spacing < 0.0 || max_val < min_val) {
        throw std::invalid_argument {
            "invalid grid range [" + std::to_string(min_val) + ", "
            + std::to_string(max_val) + "] or spacing "
            + std::to_string(spacing)
        };
    }
    const double n_points { std::ceil((max_val - min_val) / spacing) + 1.0 };
    if (!(n_points <= lut::max_grid_points)) {
        throw std::invalid_argument {
            "grid spacing " + std::to_string(spacing) + " over ["
            + std::to_string(min_val) + ", " + std::to_string(max_val)
            + "] results in more than "
            + std::to_string(static_cast<long>(lut::max_grid_points))
            + " points"
        };
    }
    Eigen::ArrayXd grid { Eigen::ArrayXd::LinSpaced(
      static_cast<Eigen::Index>(n_points), min_val, max_val) };
    if (min_spacing > lut::round_threshold) {
        grid = roundDecimals(grid, lut::round_decimals);
    }
    if (grid.size() == 1) {
        spdlog::debug("Grid spacing is 0, which is less than {}. No grid used",
                      min_spacing);
        return std::nullopt;
    }
    if (std::abs(grid(1) - grid(0)) < min_spacing) {
        spdlog::debug("Grid spacing is {}, which is less than {}. No grid used",
                      grid(1) - grid(0),
                      min_spacing);
        return std::nullopt;
    }
    return grid;
}

// Number of quadrants (out of the four sign combinations of cos and
// sin) containing at least one point. Points on an axis are not
// counted. quadrants(0, *) is positive cos, quadrants(*, 0) positive
// sin.
static auto occupiedQuadrants(const ArrayX2d& points) -> Eigen::Array22i
{
    Eigen::Array22i quadrants { Eigen::Array22i::Zero() };
    for (Eigen::Index i {}; i < points.rows(); ++i) {
        const double c { points(i, 0) };
        const double s { points(i, 1) };
        if (c == 0.0 || s == 0.0) {
            continue;
        }
        quadrants(c > 0.0 ? 0 : 1, s > 0.0 ? 0 : 1) = 1;
    }
    return quadrants;
}

// Unit circle coordinates of angles given in degrees
static auto toUnitCircle(const Eigen::ArrayXd& angles_deg) -> ArrayX2d
{
    ArrayX2d points(angles_deg.size(), 2);
    points.col(0) = (angles_deg * math::deg_to_rad).cos();
    points.col(1) = (angles_deg * math::deg_to_rad).sin();
    return points;
}

auto clusterSamples(const ArrayX2d& points) -> ArrayX2d
{
    if (points.rows() == 1) {
        ArrayX2d doubled(2, 2);
        doubled.row(0) = points.row(0);
        doubled.row(1) = points.row(0);
        return doubled;
    }
    if (points.rows() <= lut::max_cluster_samples) {
        return points;
    }
    const Eigen::ArrayXd positions { Eigen::ArrayXd::LinSpaced(
      lut::max_cluster_samples,
      0.0,
      static_cast<double>(points.rows() - 1)) };
    ArrayX2d subset(lut::max_cluster_samples, 2);
    for (Eigen::Index i {}; i < subset.rows(); ++i) {
        subset.row(i) = points.row(static_cast<Eigen::Index>(positions(i)));
    }
    return subset;
}

auto getAngularGrid(const Eigen::ArrayXd& angles,
                    const double spacing,
                    const double min_spacing,
                    const AngleUnit unit) -> std::optional<Eigen::ArrayXd>
{
    if (spacing == 0.0) {
        spdlog::debug("Grid spacing set at 0, using no grid.");
        return std::nullopt;
    }
    if (angles.size() == 0) {
        throw std::invalid_argument { "no angles to construct a grid from" };
    }
    // Angles in [0, 360) so that data on both sides of 180 degrees
    // given as e.g. 179 and -179 are contiguous
    const Eigen::ArrayXd angles_deg {
        (unit == AngleUnit::radians ? Eigen::ArrayXd { angles
                                                       * math::rad_to_deg }
                                    : angles)
          .unaryExpr([](const double a) {
              const double wrapped { std::fmod(a, 360.0) };
              return wrapped < 0.0 ? wrapped + 360.0 : wrapped;
          })
    };
    const ArrayX2d points { toUnitCircle(angles_deg) };
    const Eigen::Array22i quadrants { occupiedQuadrants(points) };
    const bool centerpoint { spacing == lut::centerpoint };

    // Angles are less than 180 degrees apart
    if (quadrants.sum() < 3 && !centerpoint) {
        if (quadrants.row(0).sum() == 2) {
            // The angles cross the 0 degree line. Rotate the data by
            // 180 degrees so that they are contiguous, grid, and
            // rotate back.
            const Eigen::ArrayXd rotated { (angles_deg + 180.0).unaryExpr(
              [](const double a) { return std::fmod(a, 360.0); }) };
            const auto spread { getGrid(
              rotated.minCoeff(), rotated.maxCoeff(), spacing, min_spacing) };
            if (!spread) {
                return std::nullopt;
            }
            return Eigen::ArrayXd { *spread - 180.0 };
        }
        return getGrid(
          angles_deg.minCoeff(), angles_deg.maxCoeff(), spacing, min_spacing);
    }

    // With a spread larger than 180 degrees there is no universal
    // answer. Cluster the data on the unit circle.
    if (spacing >= 180.0) {
        spdlog::warn("Requested angle spacing is {}, but obs angle divergence "
                     "is > 180. Tighter spacing recommended",
                     spacing);
    }
    const int n_clusters { centerpoint
                             ? 1
                             : static_cast<int>(std::ceil(360.0 / spacing)) };
    CircularMixture mixture { n_clusters };
    mixture.fit(clusterSamples(points));
    const Eigen::ArrayXd central_angles { mixture.centralAngles() };
    if (centerpoint) {
        return central_angles.head(1).eval();
    }
    const Eigen::Array22i ca_quadrants { occupiedQuadrants(mixture.means()) };
    if (ca_quadrants.sum() < quadrants.sum()) {
        spdlog::warn("Clustered angles {} span {} quadrants, while data spans "
                     "{} quadrants",
                     arrayToString(central_angles),
                     ca_quadrants.sum(),
                     quadrants.sum());
    }
    return central_angles;
}

auto angularCenter(const Eigen::ArrayXd& angles, const AngleUnit unit)
  -> double
{
    return (*getAngularGrid(angles, lut::centerpoint, 0.0, unit))(0);
}

} // namespace rtcomp
