// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Observation geometry of a single forward model evaluation

#pragma once

#include <Eigen/Dense>
#include <optional>

namespace rtcomp {

struct Geometry
{
    // Top-of-atmosphere solar zenith angle, degrees
    double solar_zenith {};
    // Viewing zenith angle, degrees
    double observer_zenith {};
    // Relative azimuth between the sun and the sensor, degrees
    double relative_azimuth {};
    // Cosine of the local solar incidence angle on a sloped surface.
    // If not set the surface is taken to be horizontal.
    std::optional<double> cos_i {};
    // Background reflectance for the hemispherical-incidence terms.
    // Defaults to the foreground reflectance.
    std::optional<Eigen::ArrayXd> bg_rfl {};
};

} // namespace rtcomp
