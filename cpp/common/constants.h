// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace rtcomp {

// Fill values to denote a missing value
namespace fill {

// Nodata value of the observation and location rasters
constexpr double nodata { -9999.0 };

} // namespace fill

namespace math {

// Multiply with this factor to convert from degrees to radians
constexpr double deg_to_rad { 0.017453292519943295 };
// Multiply with this factor to convert from radians to degrees
constexpr double rad_to_deg { 57.295779513082323 };

} // namespace math

// Radiative transfer related
namespace radiation {

// Default step of the finite difference derivatives. Small compared
// to radiance variations but well above the round-off of the array
// arithmetic.
constexpr double eps { 1e-6 };
// Fresnel reflectance factor of sky radiance on a water surface for
// a nadir view
constexpr double rho_ls { 0.02 };
// Refractive index of water
constexpr double n_water { 1.33 };
// Surface Rayleigh scattering coefficient at 550 nm [km-1]
constexpr double rayleigh_550 { 0.01159 };

} // namespace radiation

// LUT grid construction related
namespace lut {

// Spacing value requesting a single center point instead of a grid
constexpr double centerpoint { -1.0 };
// Grid values are rounded to this many decimals if the minimum
// spacing is larger than round_threshold.
constexpr int round_decimals { 4 };
constexpr double round_threshold { 1e-4 };
// Largest grid that getGrid constructs
constexpr double max_grid_points { 1e6 };
// Upper limit for the number of samples used for clustering angles
constexpr int max_cluster_samples { 1'000'000 };
// Seed of the clustering, fixed for repeatability across runs
constexpr unsigned int cluster_seed { 1 };

} // namespace lut

} // namespace rtcomp
