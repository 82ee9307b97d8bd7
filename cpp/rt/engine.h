// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Interface of a radiative transfer engine. An engine is a table
// backed provider of radiative transfer quantities (path
// reflectance, transmittances, spherical albedo, ...) bound to a
// contiguous wavelength range. Concrete engines (atmospheric code
// LUTs, emulators) live outside this library and are made available
// through the EngineRegistry.

#pragma once

#include "geometry.h"

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace rtcomp {

// Named radiative transfer quantities, one value per wavelength of
// the engine. An empty array means the quantity is not provided
// (placeholder).
using Quantities = std::map<std::string, Eigen::ArrayXd>;

// Whether the quantities of an engine are already in radiance units
// or are transmittances and reflectances that still need to be
// scaled by the solar irradiance.
enum class RTMode
{
    radiance,
    transmittance,
};

// Options that may be given for each engine, for the instrument, or
// globally for the radiative transfer model. Unset fields are
// std::nullopt (an empty LUT grid counts as unset).
struct EngineOptions
{
    std::optional<std::string> interpolator_style {};
    std::optional<bool> overwrite_interpolator {};
    std::map<std::string, std::vector<double>> lut_grid {};
    std::optional<std::string> lut_path {};
    std::optional<std::string> wavelength_file {};
};

// Merge configuration layers ordered from highest to lowest
// priority. Each field is taken from the first layer that sets it.
[[nodiscard]] auto mergeOptions(const std::vector<EngineOptions>& layers)
  -> EngineOptions;

// Everything an engine constructor receives
struct EngineParams
{
    std::string engine_name {};
    // Options resolved over the engine, instrument, and global layers
    EngineOptions options {};
    // Names of the radiative transfer state vector elements, in order
    std::vector<std::string> statevector_names {};
    // Full engine section of the configuration for engine specific
    // keys.
    YAML::Node config {};
};

class Engine
{
public:
    // Wavelength grid [nm], strictly ascending
    Eigen::ArrayXd wl {};
    // Top-of-atmosphere solar irradiance on wl
    Eigen::ArrayXd solar_irr {};
    RTMode rt_mode { RTMode::transmittance };
    // Thermal infrared engine: path radiance is thermal_upwelling and
    // the downwelling radiance is thermal_downwelling.
    bool treat_as_emissive { false };
    bool topography_model { false };
    bool glint_model { false };
    // Quantity names of the four coupled terms in the order
    // bi-directional, hemispherical-directional,
    // directional-hemispherical, bi-hemispherical.
    std::vector<std::string> coupling_terms {
        "dir-dir", "dif-dir", "dir-dif", "dif-dif"
    };
    // Position of each radiative transfer state vector element in the
    // LUT coordinates of this engine
    std::vector<int> indices_x_RT {};

    Engine() = default;
    // Interpolate all quantities at a point of the radiative transfer
    // state. Must be safe to call from several threads at once.
    [[nodiscard]] virtual auto get(const Eigen::VectorXd& x_RT,
                                   const Geometry& geom) const
      -> Quantities = 0;
    // Wavelength range, channel count, and mode from the static
    // attributes alone
    [[nodiscard]] auto describe() const -> std::string;
    // Short human readable description of the engine at a state. The
    // default is describe().
    [[nodiscard]] virtual auto summarize(const Eigen::VectorXd& x_RT,
                                         const Geometry& geom) const
      -> std::string;
    // Cosine of the solar zenith angle stored with the LUT, if any.
    // When present it is used instead of the one derived from the
    // geometry.
    [[nodiscard]] virtual auto cachedCosZenith() const -> std::optional<double>
    {
        return std::nullopt;
    }
    [[nodiscard]] auto nWavelengths() const -> int
    {
        return static_cast<int>(wl.size());
    }
    virtual ~Engine() = default;
};

[[nodiscard]] auto rtModeToString(const RTMode rt_mode) -> std::string;

// Look up a quantity that the caller cannot do without. Throws if it
// is missing or a placeholder.
[[nodiscard]] auto requireQuantity(const Quantities& quantities,
                                   const std::string& name)
  -> const Eigen::ArrayXd&;

} // namespace rtcomp
