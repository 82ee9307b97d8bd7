// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Derivatives of the at-sensor radiance with respect to the
// radiative transfer state (finite differences), the surface state
// (analytic), and the unknowns (finite differences). The engines are
// tabulated so there is no closed form for the derivatives with
// respect to the radiative transfer state.

#pragma once

#include "radiative_transfer.h"

#include <functional>

namespace rtcomp {

struct RTJacobians
{
    // Radiance derivatives with respect to the radiative transfer
    // state, one column per state vector element
    Eigen::MatrixXd K_RT {};
    // Radiance derivatives with respect to the surface state
    Eigen::MatrixXd K_surface {};
};

// Directional derivative of f at x along direction:
//   (f(x + eps * direction) - f(x)) / eps
// f_x is the already computed f(x).
[[nodiscard]] auto forwardDifference(
  const std::function<Eigen::ArrayXd(const Eigen::VectorXd&)>& f,
  const Eigen::VectorXd& x,
  const Eigen::ArrayXd& f_x,
  const Eigen::VectorXd& direction,
  const double eps) -> Eigen::ArrayXd;

// K_RT by perturbing each element of x_RT with rt.eps(). The
// perturbed evaluations are independent and run in parallel.
//
// K_surface follows from the chain rule with the derivatives of the
// reflectance (drfl_dsurface) and of the surface emission
// (dLs_dsurface) with respect to the surface state. Both have one
// row per wavelength and one column per surface state element. With
// a glint model the last two surface state elements are the direct
// and diffuse glint magnitudes.
[[nodiscard]] auto drdnDRT(const RadiativeTransfer& rt,
                           const Eigen::VectorXd& x_RT,
                           const Eigen::VectorXd& x_surface,
                           const Eigen::ArrayXd& rfl_dir,
                           const Eigen::ArrayXd& rfl_dif,
                           const Eigen::MatrixXd& drfl_dsurface,
                           const Eigen::ArrayXd& Ls,
                           const Eigen::MatrixXd& dLs_dsurface,
                           const Geometry& geom) -> RTJacobians;

// Kb_RT, the radiance derivatives with respect to the unknowns (one
// column per unknown). Only the H2O absorption coefficient
// (H2O_ABSCO) is supported, through a relative perturbation of the
// water vapor column H2OSTR. Columns of other unknowns are zero.
[[nodiscard]] auto drdnDRTb(const RadiativeTransfer& rt,
                            const Eigen::VectorXd& x_RT,
                            const Eigen::ArrayXd& rfl_dir,
                            const Eigen::ArrayXd& rfl_dif,
                            const Eigen::ArrayXd& Ls,
                            const Geometry& geom) -> Eigen::MatrixXd;

} // namespace rtcomp
