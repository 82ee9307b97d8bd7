// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "engine.h"

#include <fmt/format.h>
#include <stdexcept>

namespace rtcomp {

auto mergeOptions(const std::vector<EngineOptions>& layers) -> EngineOptions
{
    EngineOptions merged {};
    for (const EngineOptions& layer : layers) {
        if (!merged.interpolator_style) {
            merged.interpolator_style = layer.interpolator_style;
        }
        if (!merged.overwrite_interpolator) {
            merged.overwrite_interpolator = layer.overwrite_interpolator;
        }
        if (merged.lut_grid.empty()) {
            merged.lut_grid = layer.lut_grid;
        }
        if (!merged.lut_path) {
            merged.lut_path = layer.lut_path;
        }
        if (!merged.wavelength_file) {
            merged.wavelength_file = layer.wavelength_file;
        }
    }
    return merged;
}

auto Engine::summarize(const Eigen::VectorXd& /* x_RT */,
                       const Geometry& /* geom */) const -> std::string
{
    return describe();
}

auto Engine::describe() const -> std::string
{
    if (wl.size() == 0) {
        return "engine without wavelengths";
    }
    return fmt::format("{} nm - {} nm, {} channels, {} mode{}",
                       wl(0),
                       wl(wl.size() - 1),
                       wl.size(),
                       rtModeToString(rt_mode),
                       treat_as_emissive ? ", emissive" : "");
}

auto rtModeToString(const RTMode rt_mode) -> std::string
{
    switch (rt_mode) {
    case RTMode::radiance:
        return "radiance";
    case RTMode::transmittance:
        return "transmittance";
    }
    return "unknown";
}

auto requireQuantity(const Quantities& quantities,
                     const std::string& name) -> const Eigen::ArrayXd&
{
    const auto it { quantities.find(name) };
    if (it == quantities.end() || it->second.size() == 0) {
        throw std::runtime_error { "radiative transfer quantity " + name
                                   + " is not available" };
    }
    return it->second;
}

} // namespace rtcomp
