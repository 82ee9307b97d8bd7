// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "state_grids.h"

#include "lut_grid.h"

#include <common/algorithm.h>
#include <common/constants.h>
#include <common/io.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace rtcomp {

auto observerAltitudeKm(const double mean_elevation_km,
                        const double mean_to_sensor_zenith,
                        const double mean_path_km) -> double
{
    return mean_elevation_km
           + std::cos((180.0 - mean_to_sensor_zenith) * math::deg_to_rad)
               * mean_path_km;
}

auto clampElevationGrid(const ElevationGrid& elevation) -> ElevationGrid
{
    ElevationGrid clamped { elevation };
    if (clamped.grid && (clamped.grid.value() < 0.0).any()) {
        spdlog::info("Scene contains target LUT grid elements < 0 km which "
                     "the engine does not support. Setting grid points {} "
                     "to 0.",
                     arrayToString(clamped.grid->unaryExpr(
                       [](const double z) { return std::min(z, 0.0); })));
        const Eigen::ArrayXd grid { sortedUnique(clamped.grid->max(0.0)) };
        if (grid.size() == 1) {
            clamped.grid.reset();
            clamped.mean_elevation_km = grid(0);
        } else {
            clamped.grid = grid;
        }
    }
    if (clamped.mean_elevation_km < 0.0) {
        spdlog::info("Scene contains a mean target elevation < 0. Setting "
                     "mean elevation to 0.");
        clamped.mean_elevation_km = 0.0;
    }
    return clamped;
}

auto h2oRangeFromPresolve(const Eigen::ArrayXd& h2o_estimates,
                          const SettingsLUT& settings,
                          const double max_water) -> std::array<double, 2>
{
    const double h2o_min { settings.h2o.min };
    std::vector<double> above {};
    for (const double h2o : h2o_estimates) {
        if (h2o > h2o_min) {
            above.push_back(h2o);
        }
    }
    if (above.empty()) {
        spdlog::warn("no water vapor presolve estimates above {}, keeping the "
                     "configured range",
                     h2o_min);
        return { settings.h2o.range.front(), settings.h2o.range.back() };
    }
    const Eigen::Map<const Eigen::ArrayXd> values(
      above.data(), static_cast<Eigen::Index>(above.size()));
    const double p_lo { percentile(values, 2.0) };
    const double p_hi { percentile(values, 98.0) };
    const double margin { (p_hi - p_lo) * 0.5 };
    return { std::max(h2o_min, p_lo - margin),
             std::min(max_water, std::max(h2o_min, p_hi + margin)) };
}

// State vector element of an aerosol dimension with the initial
// value and prior mean one tenth up the range
static auto aerosolElement(const std::string& name,
                           const double lo,
                           const double hi) -> StateVectorElement
{
    const double init { (hi - lo) / 10.0 + lo };
    return { .name = name,
             .bounds = { lo, hi },
             .scale = 1.0,
             .init = init,
             .prior_mean = init,
             .prior_sigma = 10.0 };
}

auto aerosolLutGrids(const SettingsLUT& settings) -> AerosolGrids
{
    AerosolGrids aerosols {};
    const auto add_aerosol { [&aerosols](const int i_aer,
                                         const std::vector<double>& range,
                                         const double spacing,
                                         const double spacing_min) {
        const auto grid { getGrid(
          range.front(), range.back(), spacing, spacing_min) };
        if (!grid) {
            return;
        }
        const std::string name { "AERFRAC_" + std::to_string(i_aer) };
        aerosols.statevector.push_back(
          aerosolElement(name, range.front(), range.back()));
        aerosols.lut_grid[name] =
          std::vector<double>(grid->begin(), grid->end());
    } };
    add_aerosol(0,
                settings.aerosol_0.range,
                settings.aerosol_0.spacing,
                settings.aerosol_0.spacing_min);
    add_aerosol(1,
                settings.aerosol_1.range,
                settings.aerosol_1.spacing,
                settings.aerosol_1.spacing_min);
    add_aerosol(2,
                settings.aerosol_2.range,
                settings.aerosol_2.spacing,
                settings.aerosol_2.spacing_min);

    const auto aot_grid { getGrid(settings.aot_550.range.front(),
                                  settings.aot_550.range.back(),
                                  settings.aot_550.spacing,
                                  settings.aot_550.spacing_min) };
    if (aot_grid) {
        aerosols.lut_grid["AOT550"] =
          std::vector<double>(aot_grid->begin(), aot_grid->end());
        aerosols.statevector.push_back(aerosolElement(
          "AOT550", (*aot_grid)(0), (*aot_grid)(aot_grid->size() - 1)));
    }
    return aerosols;
}

} // namespace rtcomp
