// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Radiances along the sun-to-surface-to-sensor paths. These follow
// the nomenclature of Schaepman-Strub et al. (2006), which are the
// terms of Nicodemus et al. (1977) adapted to remote sensing by
// Martonchik et al. (2000):
//
//   bi-directional            (downward direct * upward direct)
//   hemispherical-directional ((downward direct + diffuse) * upward direct)
//   directional-hemispherical (downward direct * upward diffuse)
//   bi-hemispherical          ((downward direct + diffuse) * upward diffuse)

#pragma once

#include "engine.h"

namespace rtcomp {

struct CoupledRadiance
{
    Eigen::ArrayXd bi_direct {};
    Eigen::ArrayXd hemi_direct {};
    Eigen::ArrayXd direct_hemi {};
    Eigen::ArrayXd bi_hemi {};
};

// Compute the four coupled terms from interpolated quantities.
//
// If any of the coupling terms is missing or a placeholder, a two
// term model is used instead:
//   [transm_down_dir, transm_down_dir + transm_down_dif, 0, 0].
// Otherwise each coupling term is multiplied by scaling, which is
// solar_irr * coszen / pi where the quantities are transmittances and
// 1 where they are already radiances.
//
// The direct terms (bi-directional and directional-hemispherical)
// come scaled by the top-of-atmosphere solar zenith angle and are
// rescaled with cos_i / coszen to the local incidence angle on the
// sloped surface.
//
// The result depends only on the arguments so this can be called
// concurrently.
[[nodiscard]] auto coupledRadiance(
  const Quantities& r,
  const std::vector<std::string>& coupling_terms,
  const Eigen::ArrayXd& scaling,
  const double coszen,
  const double cos_i) -> CoupledRadiance;

} // namespace rtcomp
