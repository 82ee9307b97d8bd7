// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "jacobian.h"

#include <common/constants.h>

#include <algorithm>
#include <exception>

namespace rtcomp {

auto forwardDifference(
  const std::function<Eigen::ArrayXd(const Eigen::VectorXd&)>& f,
  const Eigen::VectorXd& x,
  const Eigen::ArrayXd& f_x,
  const Eigen::VectorXd& direction,
  const double eps) -> Eigen::ArrayXd
{
    const Eigen::VectorXd x_perturb { x + eps * direction };
    return (f(x_perturb) - f_x) / eps;
}

auto drdnDRT(const RadiativeTransfer& rt,
             const Eigen::VectorXd& x_RT,
             const Eigen::VectorXd& x_surface,
             const Eigen::ArrayXd& rfl_dir,
             const Eigen::ArrayXd& rfl_dif,
             const Eigen::MatrixXd& drfl_dsurface,
             const Eigen::ArrayXd& Ls,
             const Eigen::MatrixXd& dLs_dsurface,
             const Geometry& geom) -> RTJacobians
{
    const int n_wl { rt.nWavelengths() };
    if (drfl_dsurface.rows() != n_wl || dLs_dsurface.rows() != n_wl
        || drfl_dsurface.cols() != dLs_dsurface.cols()) {
        throw std::invalid_argument {
            "surface derivatives must have " + std::to_string(n_wl)
            + " rows and the same number of columns"
        };
    }
    const auto f { [&](const Eigen::VectorXd& x) {
        return rt.calcRdn(x, rfl_dir, rfl_dif, Ls, geom);
    } };

    // First the radiance at the current state vector
    const Eigen::ArrayXd rdn { f(x_RT) };

    // Perturb each element of the radiative transfer state
    RTJacobians jacobians {};
    const auto n_rt { static_cast<int>(x_RT.size()) };
    jacobians.K_RT.resize(n_wl, n_rt);
    std::exception_ptr error {};
#pragma omp parallel for
    for (int i = 0; i < n_rt; ++i) {
        try {
            jacobians.K_RT.col(i) =
              forwardDifference(
                f, x_RT, rdn, Eigen::VectorXd::Unit(n_rt, i), rt.eps())
                .matrix();
        } catch (...) {
            // Exceptions must not leave the parallel region. The first
            // one is rethrown after the loop.
#pragma omp critical
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }
    if (error) {
        std::rethrow_exception(error);
    }

    const RTEvaluation ev { rt.evaluate(x_RT, geom) };
    const Eigen::ArrayXd& s_alb { requireQuantity(ev.r, "sphalb") };
    const Eigen::ArrayXd& transm_up_dir { requireQuantity(ev.r,
                                                          "transm_up_dir") };
    const Eigen::ArrayXd& transm_up_dif { requireQuantity(ev.r,
                                                          "transm_up_dif") };

    // Direct and diffuse downward radiance on the sun-to-surface
    // path. The direct radiance is scaled by the top-of-atmosphere
    // solar zenith angle and is rescaled to the local incidence angle
    // on a sloped surface.
    const Eigen::ArrayXd L_down_dir { ev.L_down.dir / ev.coszen * ev.cos_i };
    const Eigen::ArrayXd& L_down_dif { ev.L_down.dif };

    // Sky glint on water surfaces
    Eigen::ArrayXd glint { Eigen::ArrayXd::Zero(n_wl) };
    if (rt.glintModel()) {
        const Eigen::Index n_s { x_surface.size() };
        if (n_s < 2 || drfl_dsurface.cols() < 2) {
            throw std::invalid_argument {
                "glint model requires at least two surface state elements"
            };
        }
        const Eigen::ArrayXd L_sky { x_surface(n_s - 2) * L_down_dir
                                     + x_surface(n_s - 1) * L_down_dif };
        glint = radiation::rho_ls * (L_sky / ev.L_down.total);
    }

    // Adjacency effects
    const Eigen::ArrayXd bg { geom.bg_rfl ? *geom.bg_rfl
                                          : Eigen::ArrayXd { rfl_dir + glint } };
    const Eigen::ArrayXd denom { 1.0 - s_alb * bg };

    // Surface reflectance and surface emission
    const Eigen::ArrayXd drdn_drfl { (L_down_dir + L_down_dif) / denom
                                     * transm_up_dir };
    const Eigen::ArrayXd drdn_dLs { transm_up_dir + transm_up_dif };
    jacobians.K_surface = drdn_drfl.matrix().asDiagonal() * drfl_dsurface
                          + drdn_dLs.matrix().asDiagonal() * dLs_dsurface;

    if (rt.glintModel()) {
        const Eigen::Index n_cols { jacobians.K_surface.cols() };
        jacobians.K_surface.col(n_cols - 2) =
          (L_down_dir * (transm_up_dir + transm_up_dif) / denom).matrix();
        jacobians.K_surface.col(n_cols - 1) =
          (L_down_dif * (transm_up_dir + transm_up_dif) / denom).matrix();
    }
    return jacobians;
}

auto drdnDRTb(const RadiativeTransfer& rt,
              const Eigen::VectorXd& x_RT,
              const Eigen::ArrayXd& rfl_dir,
              const Eigen::ArrayXd& rfl_dif,
              const Eigen::ArrayXd& Ls,
              const Geometry& geom) -> Eigen::MatrixXd
{
    const auto& bvec { rt.bvecNames() };
    const auto& names { rt.statevecNames() };
    Eigen::MatrixXd Kb_RT { Eigen::MatrixXd::Zero(
      rt.nWavelengths(), static_cast<Eigen::Index>(bvec.size())) };
    const auto it_h2o { std::ranges::find(names, std::string { "H2OSTR" }) };
    const bool has_absco { std::ranges::find(bvec, std::string { "H2O_ABSCO" })
                           != bvec.end() };
    if (it_h2o == names.end() || !has_absco) {
        return Kb_RT;
    }
    const auto i_h2o { static_cast<Eigen::Index>(it_h2o - names.begin()) };
    const auto f { [&](const Eigen::VectorXd& x) {
        return rt.calcRdn(x, rfl_dir, rfl_dif, Ls, geom);
    } };
    const Eigen::ArrayXd rdn { f(x_RT) };
    // Relative perturbation of the water vapor column by 1 + eps
    const Eigen::VectorXd direction { x_RT(i_h2o)
                                      * Eigen::VectorXd::Unit(x_RT.size(),
                                                              i_h2o) };
    const Eigen::ArrayXd dK { forwardDifference(
      f, x_RT, rdn, direction, rt.eps()) };
    for (size_t j {}; j < bvec.size(); ++j) {
        if (bvec[j] == "H2O_ABSCO") {
            Kb_RT.col(static_cast<Eigen::Index>(j)) = dK.matrix();
        }
    }
    return Kb_RT;
}

} // namespace rtcomp
