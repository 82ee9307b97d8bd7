// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "obs_metadata.h"

#include "lut_grid.h"

#include <common/algorithm.h>
#include <common/io.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace rtcomp {

// Same as numpy.isclose with default tolerances
static auto isClose(const ArrayXXd& band, const double value) -> ArrayXXb
{
    return (band - value).abs() <= 1e-8 + 1e-5 * std::abs(value);
}

static auto checkShape(const ArrayXXd& band,
                       const ArrayXXd& reference,
                       const std::string& name) -> void
{
    if (band.rows() != reference.rows() || band.cols() != reference.cols()) {
        throw std::invalid_argument { name
                                      + " does not have the dimensions of "
                                        "the other bands" };
    }
}

// Exclude the first and last lines if there are enough lines
static auto trimLines(const ArrayXXb& valid, const int trim_lines) -> ArrayXXb
{
    ArrayXXb trimmed { valid };
    if (trim_lines != 0 && valid.rows() > 2 * trim_lines) {
        trimmed.topRows(trim_lines).setConstant(false);
        trimmed.bottomRows(trim_lines).setConstant(false);
    }
    return trimmed;
}

static auto mod360(const double angle) -> double
{
    const double a { std::fmod(angle, 360.0) };
    return a < 0.0 ? a + 360.0 : a;
}

auto relativeAzimuth(const ArrayXXd& to_sun_azimuth,
                     const ArrayXXd& to_sensor_azimuth) -> ArrayXXd
{
    return (to_sun_azimuth - to_sensor_azimuth)
      .unaryExpr([](const double delta_phi) {
          return std::abs(mod360(delta_phi) - 180.0);
      });
}

auto getMetadataFromObs(const ObsGeometry& obs,
                        const SettingsLUT& settings,
                        const int trim_lines,
                        const double max_flight_duration_h,
                        const double nodata) -> ObsMetadata
{
    checkShape(obs.to_sensor_azimuth, obs.path_length, "to-sensor azimuth");
    checkShape(obs.to_sensor_zenith, obs.path_length, "to-sensor zenith");
    checkShape(obs.to_sun_azimuth, obs.path_length, "to-sun azimuth");
    checkShape(obs.to_sun_zenith, obs.path_length, "to-sun zenith");
    checkShape(obs.utc_time, obs.path_length, "UTC time");

    ObsMetadata meta {};
    meta.valid = !(isClose(obs.path_length, nodata)
                   || isClose(obs.to_sensor_azimuth, nodata)
                   || isClose(obs.to_sensor_zenith, nodata)
                   || isClose(obs.to_sun_azimuth, nodata)
                   || isClose(obs.to_sun_zenith, nodata)
                   || isClose(obs.utc_time, nodata));
    const ArrayXXb valid { trimLines(meta.valid, trim_lines) };
    if (!valid.any()) {
        throw std::runtime_error { "observation geometry has no valid pixels" };
    }

    const ArrayXXd relative_azimuth { relativeAzimuth(obs.to_sun_azimuth,
                                                      obs.to_sensor_azimuth) };
    const Eigen::ArrayXd to_sensor_zenith { maskedValues(obs.to_sensor_zenith,
                                                         valid) };
    const Eigen::ArrayXd to_sun_zenith { maskedValues(obs.to_sun_zenith,
                                                      valid) };
    const Eigen::ArrayXd to_sun_azimuth { maskedValues(obs.to_sun_azimuth,
                                                       valid) };
    const Eigen::ArrayXd rel_azimuth { maskedValues(relative_azimuth, valid) };

    meta.mean_path_km = maskedValues(obs.path_length, valid).mean() / 1000.0;
    meta.mean_to_sensor_zenith = 180.0 - angularCenter(to_sensor_zenith);
    meta.mean_to_sun_zenith = angularCenter(to_sun_zenith);
    meta.mean_to_sun_azimuth = mod360(angularCenter(to_sun_azimuth));
    meta.mean_relative_azimuth = mod360(angularCenter(rel_azimuth));

    if (auto grid { getAngularGrid(to_sensor_zenith,
                                   settings.to_sensor_zenith.spacing,
                                   settings.to_sensor_zenith.spacing_min) }) {
        meta.to_sensor_zenith_lut_grid = sortedUnique(180.0 - *grid);
    }
    if (auto grid { getAngularGrid(to_sun_zenith,
                                   settings.to_sun_zenith.spacing,
                                   settings.to_sun_zenith.spacing_min) }) {
        meta.to_sun_zenith_lut_grid = sortedUnique(*grid);
    }
    if (auto grid { getAngularGrid(rel_azimuth,
                                   settings.relative_azimuth.spacing,
                                   settings.relative_azimuth.spacing_min) }) {
        meta.relative_azimuth_lut_grid = sortedUnique(grid->unaryExpr(
          [](const double angle) { return mod360(angle); }));
    }

    // Time calculations
    Eigen::ArrayXd time { maskedValues(obs.utc_time, valid) };
    double mean_time { time.mean() };
    // UTC day crossover
    if (time.maxCoeff() > 24.0 - max_flight_duration_h
        && time.minCoeff() < max_flight_duration_h) {
        time = (time < max_flight_duration_h).select(time + 24.0, time);
        mean_time = time.mean();
        // The majority of the line was in the next UTC day
        if (mean_time > 24.0) {
            mean_time -= 24.0;
            meta.increment_day = true;
        }
    }
    meta.h_m_s[0] = std::floor(mean_time);
    meta.h_m_s[1] = std::floor((mean_time - meta.h_m_s[0]) * 60.0);
    meta.h_m_s[2] = std::floor(
      (mean_time - meta.h_m_s[0] - meta.h_m_s[1] / 60.0) * 3600.0);

    spdlog::info("Observation means:");
    spdlog::info("Path (km): {}", meta.mean_path_km);
    spdlog::info("To-sensor zenith (deg): {}", meta.mean_to_sensor_zenith);
    spdlog::info("To-sun zenith (deg): {}", meta.mean_to_sun_zenith);
    spdlog::info("To-sun azimuth (deg): {}", meta.mean_to_sun_azimuth);
    spdlog::info("Relative to-sun azimuth (deg): {}",
                 meta.mean_relative_azimuth);
    return meta;
}

auto getMetadataFromLoc(const LocationData& loc,
                        const SettingsLUT& settings,
                        const int trim_lines,
                        const double nodata,
                        const bool pressure_elevation) -> LocMetadata
{
    checkShape(loc.latitude, loc.longitude, "latitude");
    checkShape(loc.elevation, loc.longitude, "elevation");
    const ArrayXXb valid { trimLines(
      !(loc.longitude == nodata || loc.latitude == nodata
        || loc.elevation == nodata),
      trim_lines) };
    if (!valid.any()) {
        throw std::runtime_error { "location data has no valid pixels" };
    }

    LocMetadata meta {};
    meta.mean_latitude = angularCenter(maskedValues(loc.latitude, valid));
    meta.mean_longitude = angularCenter(-maskedValues(loc.longitude, valid));

    const Eigen::ArrayXd elevation_km { maskedValues(loc.elevation, valid)
                                        / 1000.0 };
    meta.mean_elevation_km = elevation_km.mean();

    double min_elev { elevation_km.minCoeff() };
    double max_elev { elevation_km.maxCoeff() };
    if (pressure_elevation) {
        min_elev = std::max(min_elev - 2.0, 0.25);
        max_elev += 2.0;
    }
    meta.elevation_lut_grid = getGrid(min_elev,
                                      max_elev,
                                      settings.elevation.spacing,
                                      settings.elevation.spacing_min);
    if (settings.flag_ocean_elevation) {
        meta.elevation_lut_grid.reset();
        meta.mean_elevation_km = 0.0;
    }
    return meta;
}

} // namespace rtcomp
