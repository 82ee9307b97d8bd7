// Unit tests for the LUT grid construction

#include "../testing.h"

#include <common/algorithm.h>
#include <common/constants.h>
#include <lut/circular_mixture.h>
#include <lut/lut_grid.h>
#include <lut/settings_lut.h>
#include <lut/state_grids.h>

#include <algorithm>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// Points on the unit circle at the given angles [deg]
auto unitCircle(const Eigen::ArrayXd& angles) -> ArrayX2d
{
    ArrayX2d points(angles.size(), 2);
    points.col(0) = (angles * rtcomp::math::deg_to_rad).cos();
    points.col(1) = (angles * rtcomp::math::deg_to_rad).sin();
    return points;
}

TEST_CASE("unit tests")
{
    // Run all tests

    SECTION("Regular grid")
    {
        const auto grid { rtcomp::getGrid(0.0, 10.0, 2.0, 0.1) };
        REQUIRE(grid);
        REQUIRE(grid->size() == 6);
        for (int i {}; i < 6; ++i) {
            CHECK_THAT((*grid)(i), WithinAbs(2.0 * i, 1e-12));
        }
        // Spacing rounded up to the next whole number of intervals
        const auto grid_ceil { rtcomp::getGrid(0.0, 1.0, 0.4, 0.01) };
        REQUIRE(grid_ceil);
        REQUIRE(grid_ceil->size() == 4);
        CHECK_THAT((*grid_ceil)(1), WithinAbs(0.3333, 1e-12));
        CHECK_THAT((*grid_ceil)(3), WithinAbs(1.0, 1e-12));
    }

    SECTION("No grid")
    {
        // Zero spacing
        CHECK(!rtcomp::getGrid(0.0, 10.0, 0.0, 0.1));
        // Range narrower than the minimum spacing
        CHECK(!rtcomp::getGrid(0.0, 0.05, 1.0, 0.1));
        // Single point
        CHECK(!rtcomp::getGrid(3.0, 3.0, 1.0, 0.1));
        CHECK_THROWS_AS(rtcomp::getGrid(0.0, 1.0, -0.5, 0.1),
                        std::invalid_argument);
        CHECK_THROWS_AS(rtcomp::getGrid(1.0, 0.0, 0.5, 0.1),
                        std::invalid_argument);
        // Too many points
        CHECK_THROWS_AS(rtcomp::getGrid(0.0, 1e9, 1e-3, 0.0),
                        std::invalid_argument);
        CHECK_THROWS_AS(rtcomp::getGrid(0.0, 1.0, 1e-300, 0.0),
                        std::invalid_argument);
    }

    SECTION("Angular grid without wraparound")
    {
        const Eigen::ArrayXd angles { { 10.0, 20.0, 30.0 } };
        const auto grid { rtcomp::getAngularGrid(angles, 10.0, 2.0) };
        REQUIRE(grid);
        REQUIRE(grid->size() == 3);
        CHECK_THAT((*grid)(0), WithinAbs(10.0, 1e-12));
        CHECK_THAT((*grid)(2), WithinAbs(30.0, 1e-12));
        CHECK(!rtcomp::getAngularGrid(angles, 0.0, 2.0));
    }

    SECTION("Angular grid across 0 degrees")
    {
        const Eigen::ArrayXd angles { { 359.0, 1.0, 358.0, 2.0 } };
        const auto grid { rtcomp::getAngularGrid(angles, 2.0, 0.5) };
        REQUIRE(grid);
        REQUIRE(grid->size() == 3);
        // The grid spans 4 degrees and not the whole circle
        CHECK_THAT((*grid)(0), WithinAbs(-2.0, 1e-12));
        CHECK_THAT((*grid)(1), WithinAbs(0.0, 1e-12));
        CHECK_THAT((*grid)(2), WithinAbs(2.0, 1e-12));
        const auto grid_coarse { rtcomp::getAngularGrid(angles, 10.0, 2.0) };
        REQUIRE(grid_coarse);
        CHECK(grid_coarse->size() == 2);
        CHECK_THAT(grid_coarse->maxCoeff() - grid_coarse->minCoeff(),
                   WithinAbs(4.0, 1e-12));
    }

    SECTION("Angular grid across 180 degrees")
    {
        // Same data in the -180 to 180 and the 0 to 360 convention
        const Eigen::ArrayXd signed_angles { { 179.0, -179.0 } };
        const auto grid { rtcomp::getAngularGrid(signed_angles, 1.0, 0.5) };
        REQUIRE(grid);
        REQUIRE(grid->size() == 3);
        CHECK_THAT((*grid)(0), WithinAbs(179.0, 1e-12));
        CHECK_THAT((*grid)(2), WithinAbs(181.0, 1e-12));
        const auto grid_360 { rtcomp::getAngularGrid(
          Eigen::ArrayXd { { 179.0, 181.0 } }, 1.0, 0.5) };
        REQUIRE(grid_360);
        CHECK((*grid_360 == *grid).all());
    }

    SECTION("Angular grid in radians")
    {
        const Eigen::ArrayXd angles { { 0.1, 0.2 } };
        CHECK_THAT(
          rtcomp::angularCenter(angles, rtcomp::AngleUnit::radians),
          WithinRel(0.15 * rtcomp::math::rad_to_deg, 1e-9));
        CHECK(rtcomp::angleUnitFromString("R") == rtcomp::AngleUnit::radians);
        CHECK(rtcomp::angleUnitFromString("degrees")
              == rtcomp::AngleUnit::degrees);
        CHECK_THROWS_AS(rtcomp::angleUnitFromString("gon"),
                        std::invalid_argument);
    }

    SECTION("Center point")
    {
        const Eigen::ArrayXd angles { { 10.0, 20.0 } };
        const auto center { rtcomp::getAngularGrid(
          angles, rtcomp::lut::centerpoint, 0.0) };
        REQUIRE(center);
        REQUIRE(center->size() == 1);
        CHECK_THAT((*center)(0), WithinAbs(15.0, 1e-9));
        // The mean of 350 and 10 degrees is 0 and not 180
        const Eigen::ArrayXd wrap { { 350.0, 10.0 } };
        CHECK_THAT(rtcomp::angularCenter(wrap), WithinAbs(0.0, 1e-9));
        // A single angle is its own center
        const Eigen::ArrayXd single { { 42.0 } };
        CHECK_THAT(rtcomp::angularCenter(single), WithinAbs(42.0, 1e-9));
    }

    SECTION("Clustered angles")
    {
        // Four groups of angles, one in each quadrant
        std::vector<double> buf {};
        for (const double center : { 45.0, 135.0, 225.0, 315.0 }) {
            for (const double offset : { -2.0, -1.0, 0.0, 1.0, 2.0 }) {
                buf.push_back(center + offset);
            }
        }
        const Eigen::ArrayXd angles { Eigen::Map<Eigen::ArrayXd>(
          buf.data(), static_cast<Eigen::Index>(buf.size())) };
        const auto grid { rtcomp::getAngularGrid(angles, 90.0, 10.0) };
        REQUIRE(grid);
        REQUIRE(grid->size() == 4);
        std::vector<double> centers {};
        for (const double angle : *grid) {
            centers.push_back(angle < 0.0 ? angle + 360.0 : angle);
        }
        std::ranges::sort(centers);
        CHECK_THAT(centers[0], WithinAbs(45.0, 0.5));
        CHECK_THAT(centers[1], WithinAbs(135.0, 0.5));
        CHECK_THAT(centers[2], WithinAbs(225.0, 0.5));
        CHECK_THAT(centers[3], WithinAbs(315.0, 0.5));
    }

    SECTION("Clustering of many angles")
    {
        const Eigen::Index n_angles { rtcomp::lut::max_cluster_samples + 1001 };
        const Eigen::ArrayXd angles { Eigen::ArrayXd::LinSpaced(
          n_angles, 20.0, 40.0) };
        const ArrayX2d points { unitCircle(angles) };
        const ArrayX2d samples { rtcomp::clusterSamples(points) };
        REQUIRE(samples.rows() == rtcomp::lut::max_cluster_samples);
        CHECK((samples.row(0) == points.row(0)).all());
        CHECK((samples.row(samples.rows() - 1) == points.row(n_angles - 1))
                .all());
        // Fewer points are used as they are
        CHECK(rtcomp::clusterSamples(points.topRows(10)).rows() == 10);
        CHECK(rtcomp::clusterSamples(points.topRows(1)).rows() == 2);
        // Center of the subsampled data
        CHECK_THAT(rtcomp::angularCenter(angles), WithinAbs(30.0, 1e-3));
    }

    SECTION("Mixture model")
    {
        const Eigen::ArrayXd angles { { 88.0, 90.0, 92.0, -88.0, -90.0, -92.0 } };
        rtcomp::CircularMixture mixture { 2 };
        mixture.fit(unitCircle(angles));
        CHECK(mixture.converged());
        const Eigen::ArrayXd central { mixture.centralAngles() };
        REQUIRE(central.size() == 2);
        CHECK_THAT(central.abs().minCoeff(), WithinAbs(90.0, 1e-6));
        CHECK_THAT(central.abs().maxCoeff(), WithinAbs(90.0, 1e-6));
        CHECK(central(0) * central(1) < 0.0);
        // More components than points
        rtcomp::CircularMixture mixture_big { 10 };
        mixture_big.fit(unitCircle(Eigen::ArrayXd { { 0.0, 60.0 } }));
        CHECK(mixture_big.means().rows() == 2);
        CHECK_THROWS_AS(mixture_big.fit(ArrayX2d(0, 2)), std::invalid_argument);
    }

    SECTION("Percentile")
    {
        const Eigen::ArrayXd values { { 4.0, 1.0, 3.0, 2.0 } };
        CHECK_THAT(rtcomp::percentile(values, 0.0), WithinAbs(1.0, 1e-12));
        CHECK_THAT(rtcomp::percentile(values, 50.0), WithinAbs(2.5, 1e-12));
        CHECK_THAT(rtcomp::percentile(values, 100.0), WithinAbs(4.0, 1e-12));
        CHECK_THROWS_AS(rtcomp::percentile(Eigen::ArrayXd {}, 50.0),
                        std::invalid_argument);
        const Eigen::ArrayXd dup { { 2.0, 1.0, 2.0 } };
        const Eigen::ArrayXd unique { rtcomp::sortedUnique(dup) };
        REQUIRE(unique.size() == 2);
        CHECK(unique(0) == 1.0);
    }

    SECTION("Elevation grid clamped at sea level")
    {
        rtcomp::ElevationGrid below { Eigen::ArrayXd { { -0.5, -0.25, 0.0, 0.25 } },
                                      -0.1 };
        const rtcomp::ElevationGrid clamped { rtcomp::clampElevationGrid(
          below) };
        REQUIRE(clamped.grid);
        REQUIRE(clamped.grid->size() == 2);
        CHECK((*clamped.grid)(0) == 0.0);
        CHECK_THAT((*clamped.grid)(1), WithinAbs(0.25, 1e-12));
        CHECK(clamped.mean_elevation_km == 0.0);
        // All points collapse into one
        const rtcomp::ElevationGrid collapsed { rtcomp::clampElevationGrid(
          { Eigen::ArrayXd { { -0.5, -0.25, 0.0 } }, -0.2 }) };
        CHECK(!collapsed.grid);
        CHECK(collapsed.mean_elevation_km == 0.0);
        // Nothing to do
        const rtcomp::ElevationGrid above { rtcomp::clampElevationGrid(
          { Eigen::ArrayXd { { 0.5, 1.0 } }, 0.75 }) };
        REQUIRE(above.grid);
        CHECK(above.grid->size() == 2);
        CHECK_THAT(above.mean_elevation_km, WithinAbs(0.75, 1e-12));
    }

    SECTION("Observer altitude")
    {
        CHECK_THAT(rtcomp::observerAltitudeKm(1.0, 170.0, 5.0),
                   WithinRel(5.92403876506104, 1e-12));
    }
}
