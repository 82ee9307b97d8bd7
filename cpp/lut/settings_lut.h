// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing the LUT grid parameters. For each dimension the
// spacing is the anticipated distance between grid points, or 0 to
// use a single point (no grid). If the data do not span at least
// spacing_min, a single point is used as well.

#pragma once

#include <common/settings.h>

namespace rtcomp {

class SettingsLUT : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    struct
    {
        Setting<double> spacing { { "elevation", "spacing" },
                                  0.25,
                                  "surface elevation grid spacing, km" };
        Setting<double> spacing_min { { "elevation", "spacing_min" },
                                      0.2,
                                      "minimum surface elevation spacing, km" };
    } elevation;

    struct
    {
        Setting<double> spacing { { "h2o", "spacing" },
                                  0.25,
                                  "water vapor grid spacing, g cm-2" };
        Setting<double> spacing_min { { "h2o", "spacing_min" },
                                      0.03,
                                      "minimum water vapor spacing, g cm-2" };
        Setting<double> min { { "h2o", "min" },
                              0.05,
                              "minimum allowed water vapor value, g cm-2" };
        Setting<std::vector<double>> range {
            { "h2o", "range" },
            { 0.05, 5.0 },
            "Water vapor range, g cm-2. Replaced by the range of the\n"
            "presolve estimates when those are available."
        };
    } h2o;

    struct
    {
        Setting<double> spacing { { "to_sensor_zenith", "spacing" },
                                  10.0,
                                  "to-sensor zenith grid spacing, degrees" };
        Setting<double> spacing_min { { "to_sensor_zenith", "spacing_min" },
                                      2.0,
                                      "minimum to-sensor zenith spacing" };
    } to_sensor_zenith;

    struct
    {
        Setting<double> spacing { { "to_sun_zenith", "spacing" },
                                  10.0,
                                  "to-sun zenith grid spacing, degrees" };
        Setting<double> spacing_min { { "to_sun_zenith", "spacing_min" },
                                      2.0,
                                      "minimum to-sun zenith spacing" };
    } to_sun_zenith;

    struct
    {
        Setting<double> spacing { { "relative_azimuth", "spacing" },
                                  60.0,
                                  "relative azimuth grid spacing, degrees" };
        Setting<double> spacing_min { { "relative_azimuth", "spacing_min" },
                                      25.0,
                                      "minimum relative azimuth spacing" };
    } relative_azimuth;

    struct
    {
        Setting<double> spacing { { "aerosol_0", "spacing" },
                                  0.0,
                                  "aerosol 0 grid spacing, AOD" };
        Setting<double> spacing_min { { "aerosol_0", "spacing_min" },
                                      0.0,
                                      "minimum aerosol 0 spacing" };
        Setting<std::vector<double>> range { { "aerosol_0", "range" },
                                             { 0.001, 1.0 },
                                             "aerosol 0 range, AOD" };
    } aerosol_0;

    struct
    {
        Setting<double> spacing { { "aerosol_1", "spacing" },
                                  0.0,
                                  "aerosol 1 grid spacing, AOD" };
        Setting<double> spacing_min { { "aerosol_1", "spacing_min" },
                                      0.0,
                                      "minimum aerosol 1 spacing" };
        Setting<std::vector<double>> range { { "aerosol_1", "range" },
                                             { 0.001, 1.0 },
                                             "aerosol 1 range, AOD" };
    } aerosol_1;

    struct
    {
        Setting<double> spacing { { "aerosol_2", "spacing" },
                                  0.25,
                                  "aerosol 2 grid spacing, AOD" };
        Setting<double> spacing_min { { "aerosol_2", "spacing_min" },
                                      0.0,
                                      "minimum aerosol 2 spacing" };
        Setting<std::vector<double>> range { { "aerosol_2", "range" },
                                             { 0.001, 1.0 },
                                             "aerosol 2 range, AOD" };
    } aerosol_2;

    struct
    {
        Setting<double> spacing { { "aot_550", "spacing" },
                                  0.0,
                                  "aerosol optical thickness at 550 nm grid\n"
                                  "spacing" };
        Setting<double> spacing_min { { "aot_550", "spacing_min" },
                                      0.0,
                                      "minimum AOT550 spacing" };
        Setting<std::vector<double>> range { { "aot_550", "range" },
                                             { 0.001, 1.0 },
                                             "AOT550 range" };
    } aot_550;

    Setting<bool> flag_ocean_elevation {
        { "flag_ocean_elevation" },
        false,
        "Scene is over the ocean: no elevation grid and a mean elevation\n"
        "of 0 km."
    };
    Setting<bool> emulator {
        { "emulator" },
        false,
        "Whether the LUT is for an emulator. Emulators are parameterized\n"
        "by AOT550 which then takes the range and spacing of aerosol 2."
    };

    SettingsLUT() = default;
    SettingsLUT(const std::string& yaml_file) : Settings { yaml_file } {}
    SettingsLUT(const YAML::Node& yaml_node) : Settings { yaml_node } {}
    auto scanKeys() -> void override;
    ~SettingsLUT() = default;
};

} // namespace rtcomp
