// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Small physical relations used alongside the radiative transfer model

#pragma once

namespace rtcomp {

// Reflectance factor of sky radiance on a water surface based on the
// Fresnel equation for unpolarized light, as a function of the view
// zenith angle in degrees. Converges to 0.02 for a nadir view.
[[nodiscard]] auto fresnelReflectanceFactor(const double vza) -> double;

// Visibility [km] corresponding to an aerosol extinction at 550 nm
// [km-1] (Koschmieder relation with a 2% contrast threshold). The
// Rayleigh extinction is added to the aerosol part.
[[nodiscard]] auto ext550ToVis(const double ext550) -> double;

} // namespace rtcomp
