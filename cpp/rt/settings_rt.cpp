// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_rt.h"

#include "engine_registry.h"

#include <common/io.h>

#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace rtcomp {

auto SettingsRT::scanKeys() -> void
{
    scan(radiative_transfer.interpolator_style);
    scan(radiative_transfer.overwrite_interpolator);
    scan(radiative_transfer.lut_grid);
    scan(radiative_transfer.lut_path);
    scan(radiative_transfer.wavelength_file);
    scan(radiative_transfer.statevector);
    scan(radiative_transfer.unknowns);
    scan(radiative_transfer.engines);

    scan(instrument.interpolator_style);
    scan(instrument.overwrite_interpolator);
    scan(instrument.lut_grid);
    scan(instrument.lut_path);
    scan(instrument.wavelength_file);

    scan(jacobian.eps);
}

auto SettingsRT::checkParameters() -> void
{
    for (const EngineConfig& engine : radiative_transfer.engines) {
        const auto names { engineNames() };
        if (std::ranges::find(names, engine.engine_name) == names.end()) {
            const std::string msg {
                "Invalid radiative transfer engine choice. Got: "
                + engine.engine_name
                + "; Must be one of: " + joinStrings(names, ", ")
            };
            spdlog::error(msg);
            throw std::invalid_argument { msg };
        }
    }
    std::set<std::string> seen {};
    for (const StateVectorElement& element : radiative_transfer.statevector) {
        if (!seen.insert(element.name).second) {
            throw std::runtime_error { "state vector element " + element.name
                                       + " is defined more than once" };
        }
        const auto [lo, hi] { element.bounds };
        if (lo > hi || element.init < lo || element.init > hi) {
            throw std::runtime_error {
                "state vector element " + element.name
                + ": bounds and initial value must satisfy lo <= init <= hi"
            };
        }
        if (element.prior_sigma <= 0.0) {
            throw std::runtime_error { "state vector element " + element.name
                                       + ": prior_sigma must be positive" };
        }
    }
    if (jacobian.eps <= 0.0) {
        throw std::runtime_error { "[jacobian][eps] must be positive" };
    }
}

auto SettingsRT::engineOptions(const EngineConfig& engine) const
  -> EngineOptions
{
    const EngineOptions instrument_layer {
        .interpolator_style = instrument.interpolator_style,
        .overwrite_interpolator = instrument.overwrite_interpolator,
        .lut_grid = instrument.lut_grid,
        .lut_path = instrument.lut_path,
        .wavelength_file = instrument.wavelength_file,
    };
    const EngineOptions global_layer {
        .interpolator_style = radiative_transfer.interpolator_style,
        .overwrite_interpolator = radiative_transfer.overwrite_interpolator,
        .lut_grid = radiative_transfer.lut_grid,
        .lut_path = radiative_transfer.lut_path,
        .wavelength_file = radiative_transfer.wavelength_file,
    };
    return mergeOptions({ engine.options, instrument_layer, global_layer });
}

auto SettingsRT::statevectorNames() const -> std::vector<std::string>
{
    std::vector<std::string> names {};
    for (const StateVectorElement& element : radiative_transfer.statevector) {
        names.push_back(element.name);
    }
    return names;
}

} // namespace rtcomp
