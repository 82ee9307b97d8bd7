// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the radiative
// transfer model

#pragma once

#include "state_vector.h"

#include <common/constants.h>
#include <common/settings.h>

namespace rtcomp {

class SettingsRT : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    struct
    {
        Setting<std::optional<std::string>> interpolator_style {
            { "radiative_transfer", "interpolator_style" },
            "global default of the LUT interpolation method"
        };
        Setting<std::optional<bool>> overwrite_interpolator {
            { "radiative_transfer", "overwrite_interpolator" },
            "global default of whether to rebuild a stored interpolator"
        };
        Setting<std::map<std::string, std::vector<double>>> lut_grid {
            { "radiative_transfer", "lut_grid" },
            {},
            "global default of the LUT grid, one list of grid points per\n"
            "LUT dimension"
        };
        Setting<std::optional<std::string>> lut_path {
            { "radiative_transfer", "lut_path" },
            "global default of the LUT file"
        };
        Setting<std::optional<std::string>> wavelength_file {
            { "radiative_transfer", "wavelength_file" },
            "global default of the wavelength calibration file"
        };
        Setting<std::vector<StateVectorElement>> statevector {
            { "radiative_transfer", "statevector" },
            {},
            "Radiative transfer state vector elements in the order of the\n"
            "state vector. Each element is a map with the keys name,\n"
            "bounds, scale, init, prior_mean, and prior_sigma."
        };
        Setting<std::vector<UnknownElement>> unknowns {
            { "radiative_transfer", "unknowns" },
            {},
            "Parameters that are not retrieved but contribute to the error\n"
            "budget, each a map with the keys name and sigma. Only\n"
            "H2O_ABSCO has a nonzero radiance sensitivity."
        };
        Setting<std::vector<EngineConfig>> engines {
            { "radiative_transfer", "radiative_transfer_engines" },
            {},
            "Radiative transfer engines, each a map with at least the key\n"
            "engine_name. Engine level options (interpolator_style,\n"
            "overwrite_interpolator, lut_grid, lut_path, wavelength_file)\n"
            "take priority over the instrument and global values."
        };
    } radiative_transfer;

    struct
    {
        Setting<std::optional<std::string>> interpolator_style {
            { "instrument", "interpolator_style" },
            "instrument default of the LUT interpolation method"
        };
        Setting<std::optional<bool>> overwrite_interpolator {
            { "instrument", "overwrite_interpolator" },
            "instrument default of whether to rebuild a stored interpolator"
        };
        Setting<std::map<std::string, std::vector<double>>> lut_grid {
            { "instrument", "lut_grid" },
            {},
            "instrument default of the LUT grid"
        };
        Setting<std::optional<std::string>> lut_path {
            { "instrument", "lut_path" },
            "instrument default of the LUT file"
        };
        Setting<std::optional<std::string>> wavelength_file {
            { "instrument", "wavelength_file" },
            "instrument wavelength calibration file"
        };
    } instrument;

    struct
    {
        Setting<double> eps {
            { "jacobian", "eps" },
            radiation::eps,
            "step of the finite difference derivatives with respect to the\n"
            "radiative transfer state"
        };
    } jacobian;

    SettingsRT() = default;
    SettingsRT(const std::string& yaml_file) : Settings { yaml_file } {}
    SettingsRT(const YAML::Node& yaml_node) : Settings { yaml_node } {}
    auto scanKeys() -> void override;
    // Options of one engine after resolving the engine, instrument,
    // and global levels
    [[nodiscard]] auto engineOptions(const EngineConfig& engine) const
      -> EngineOptions;
    [[nodiscard]] auto statevectorNames() const -> std::vector<std::string>;
    ~SettingsRT() = default;
};

} // namespace rtcomp
