// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Scene averages and LUT grids of the observation geometry and of
// the location of a flightline. The input rasters are lines x
// samples. Pixels where any band equals the nodata value are
// ignored, as are a number of lines at the beginning and the end of
// the flightline which often contain erroneous values.

#pragma once

#include "settings_lut.h"

#include <array>
#include <common/constants.h>
#include <common/eigen.h>
#include <optional>

namespace rtcomp {

// Observation geometry per pixel
struct ObsGeometry
{
    // Distance between the sensor and the ground, m
    ArrayXXd path_length {};
    // Angles in degrees
    ArrayXXd to_sensor_azimuth {};
    ArrayXXd to_sensor_zenith {};
    ArrayXXd to_sun_azimuth {};
    ArrayXXd to_sun_zenith {};
    // UTC time, decimal hours
    ArrayXXd utc_time {};
};

struct ObsMetadata
{
    // Hour, minute, and second of the mean acquisition time
    std::array<double, 3> h_m_s {};
    // Whether the UTC day has changed since the start of the flightline
    bool increment_day { false };
    double mean_path_km {};
    // In the MODTRAN convention, i.e. 180 - zenith
    double mean_to_sensor_zenith {};
    double mean_to_sun_zenith {};
    double mean_to_sun_azimuth {};
    double mean_relative_azimuth {};
    // Pixels that are not nodata (including the trimmed lines)
    ArrayXXb valid {};
    std::optional<Eigen::ArrayXd> to_sensor_zenith_lut_grid {};
    std::optional<Eigen::ArrayXd> to_sun_zenith_lut_grid {};
    std::optional<Eigen::ArrayXd> relative_azimuth_lut_grid {};
};

// Location per pixel
struct LocationData
{
    // Degrees east
    ArrayXXd longitude {};
    // Degrees north
    ArrayXXd latitude {};
    // Surface elevation, m
    ArrayXXd elevation {};
};

struct LocMetadata
{
    double mean_latitude {};
    // Degrees west, the sign convention of the atmospheric codes
    double mean_longitude {};
    double mean_elevation_km {};
    std::optional<Eigen::ArrayXd> elevation_lut_grid {};
};

// Relative azimuth between the sun and the sensor, degrees in
// [0, 180]
[[nodiscard]] auto relativeAzimuth(const ArrayXXd& to_sun_azimuth,
                                   const ArrayXXd& to_sensor_azimuth)
  -> ArrayXXd;

[[nodiscard]] auto getMetadataFromObs(const ObsGeometry& obs,
                                      const SettingsLUT& settings,
                                      const int trim_lines = 5,
                                      const double max_flight_duration_h = 8.0,
                                      const double nodata = fill::nodata)
  -> ObsMetadata;

// If pressure_elevation is set, the elevation grid is widened for
// retrieving the surface pressure.
[[nodiscard]] auto getMetadataFromLoc(const LocationData& loc,
                                      const SettingsLUT& settings,
                                      const int trim_lines = 5,
                                      const double nodata = fill::nodata,
                                      const bool pressure_elevation = false)
  -> LocMetadata;

} // namespace rtcomp
