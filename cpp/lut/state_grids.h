// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// LUT grids and state vector elements of the atmospheric state
// (surface elevation, water vapor, aerosols) and related quantities
// needed to set up the radiative transfer engines of a flightline.

#pragma once

#include "settings_lut.h"

#include <common/eigen.h>
#include <optional>
#include <rt/state_vector.h>

namespace rtcomp {

// Altitude of the sensor above sea level, km. The to-sensor zenith
// is in the MODTRAN convention (180 - zenith).
[[nodiscard]] auto observerAltitudeKm(const double mean_elevation_km,
                                      const double mean_to_sensor_zenith,
                                      const double mean_path_km) -> double;

struct ElevationGrid
{
    std::optional<Eigen::ArrayXd> grid {};
    double mean_elevation_km {};
};

// Some engines (6S through sRTMnet) do not support targets below
// sea level. Negative grid points and a negative mean elevation are
// set to 0. The grid is collapsed to a single point if only one
// point remains.
[[nodiscard]] auto clampElevationGrid(const ElevationGrid& elevation)
  -> ElevationGrid;

// Water vapor range from a presolve: the 2nd and 98th percentiles of
// the estimates above the minimum water vapor, widened by half their
// distance and clipped to [h2o min, max_water].
[[nodiscard]] auto h2oRangeFromPresolve(const Eigen::ArrayXd& h2o_estimates,
                                        const SettingsLUT& settings,
                                        const double max_water)
  -> std::array<double, 2>;

struct AerosolGrids
{
    std::vector<StateVectorElement> statevector {};
    std::map<std::string, std::vector<double>> lut_grid {};
};

// State vector elements and LUT grids of the aerosol types
// (AERFRAC_0, AERFRAC_1, AERFRAC_2) and of AOT550. A dimension
// without a grid is not part of the state vector.
[[nodiscard]] auto aerosolLutGrids(const SettingsLUT& settings)
  -> AerosolGrids;

} // namespace rtcomp
