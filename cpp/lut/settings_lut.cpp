// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_lut.h"

#include <spdlog/spdlog.h>

namespace rtcomp {

auto SettingsLUT::scanKeys() -> void
{
    scan(elevation.spacing);
    scan(elevation.spacing_min);

    scan(h2o.spacing);
    scan(h2o.spacing_min);
    scan(h2o.min);
    scan(h2o.range);

    scan(to_sensor_zenith.spacing);
    scan(to_sensor_zenith.spacing_min);
    scan(to_sun_zenith.spacing);
    scan(to_sun_zenith.spacing_min);
    scan(relative_azimuth.spacing);
    scan(relative_azimuth.spacing_min);

    scan(aerosol_0.spacing);
    scan(aerosol_0.spacing_min);
    scan(aerosol_0.range);
    scan(aerosol_1.spacing);
    scan(aerosol_1.spacing_min);
    scan(aerosol_1.range);
    scan(aerosol_2.spacing);
    scan(aerosol_2.spacing_min);
    scan(aerosol_2.range);
    scan(aot_550.spacing);
    scan(aot_550.spacing_min);
    scan(aot_550.range);

    scan(flag_ocean_elevation);
    scan(emulator);
}

auto SettingsLUT::checkParameters() -> void
{
    for (const auto* range : { &h2o.range,
                               &aerosol_0.range,
                               &aerosol_1.range,
                               &aerosol_2.range,
                               &aot_550.range }) {
        if (range->size() != 2 || range->front() > range->back()) {
            throw std::runtime_error { range->keyToStr()
                                       + " must be a list [min, max]" };
        }
    }
    for (const auto* spacing : { &elevation.spacing,
                                 &h2o.spacing,
                                 &to_sensor_zenith.spacing,
                                 &to_sun_zenith.spacing,
                                 &relative_azimuth.spacing,
                                 &aerosol_0.spacing,
                                 &aerosol_1.spacing,
                                 &aerosol_2.spacing,
                                 &aot_550.spacing }) {
        if (spacing->value < 0.0) {
            throw std::runtime_error { spacing->keyToStr()
                                       + " must not be negative" };
        }
    }
    // Emulators are parameterized by AOT550 instead of the third
    // aerosol type.
    if (emulator) {
        aot_550.range =
          static_cast<const std::vector<double>&>(aerosol_2.range);
        aot_550.spacing = aerosol_2.spacing.value;
        aot_550.spacing_min = aerosol_2.spacing_min.value;
        aerosol_2.spacing = 0.0;
        spdlog::debug("emulator: AOT550 takes the range and spacing of "
                      "aerosol 2");
    }
}

} // namespace rtcomp
