// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "physics.h"

#include <common/constants.h>

#include <cmath>

namespace rtcomp {

auto fresnelReflectanceFactor(const double vza) -> double
{
    if (vza <= 0.0) {
        return radiation::rho_ls;
    }
    const double theta { vza * math::deg_to_rad };
    // Angle of refraction from Snell's law
    const double theta_i { std::asin(std::sin(theta) / radiation::n_water) };
    const double sin_ratio { std::sin(theta - theta_i)
                             / std::sin(theta + theta_i) };
    const double tan_ratio { std::tan(theta - theta_i)
                             / std::tan(theta + theta_i) };
    return 0.5 * std::abs(sin_ratio * sin_ratio + tan_ratio * tan_ratio);
}

auto ext550ToVis(const double ext550) -> double
{
    return std::log(50.0) / (ext550 + radiation::rayleigh_550);
}

} // namespace rtcomp
