// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Radiative transfer component of the forward model. A list of
// engines, each covering a part of the spectrum, is maintained and
// their quantities are concatenated to form the complete result.
//
// Some of the state vector elements are shared between engines and
// spectral ranges. For example, H2OSTR is shared between the VNIR
// and the thermal infrared. This class holds the master list of
// state vector elements.

#pragma once

#include "coupled_radiance.h"
#include "engine_registry.h"
#include "settings_rt.h"

#include <common/eigen.h>
#include <memory>
#include <mutex>

namespace rtcomp {

// Downward radiance at the surface after transmission through the
// atmosphere
struct DownwellingRadiance
{
    Eigen::ArrayXd total {};
    Eigen::ArrayXd dir {};
    Eigen::ArrayXd dif {};
};

// Everything derived from one query of each engine
struct RTEvaluation
{
    // Quantities common to all engines, concatenated over wavelength
    Quantities r {};
    // Atmospheric path radiance
    Eigen::ArrayXd L_atm {};
    DownwellingRadiance L_down {};
    // Cosine of the top-of-atmosphere solar zenith angle
    double coszen {};
    // Cosine of the local solar incidence angle
    double cos_i {};
};

class RadiativeTransfer
{
private:
    // Sorted by the first wavelength
    std::vector<std::unique_ptr<Engine>> engines {};
    std::vector<std::string> statevec_names {};
    std::vector<std::string> bvec {};
    Eigen::VectorXd bval_ {};
    Eigen::ArrayXd wl_ {};
    Eigen::ArrayXd solar_irr_ {};
    ArrayX2d bounds_ {};
    Eigen::VectorXd scale_ {};
    Eigen::VectorXd init_ {};
    Eigen::VectorXd prior_mean {};
    Eigen::VectorXd prior_sigma {};
    bool topography_model_ { false };
    bool glint_model_ { false };
    double eps_ {};
    // The loss of quantities by the merge is reported once as a
    // warning and subsequently at debug level.
    mutable std::once_flag merge_warning {};

    // Query every engine once
    [[nodiscard]] auto queryEngines(const Eigen::VectorXd& x_RT,
                                    const Geometry& geom) const
      -> std::vector<Quantities>;
    // Atmospheric path radiance from engine results
    [[nodiscard]] auto pathRadiance(const std::vector<Quantities>& results,
                                    const double coszen) const
      -> Eigen::ArrayXd;
    [[nodiscard]] auto downwelling(const std::vector<Quantities>& results,
                                   const double coszen) const
      -> DownwellingRadiance;
    // Factor converting the coupled terms of each engine to radiance
    [[nodiscard]] auto couplingScaling(const double coszen) const
      -> Eigen::ArrayXd;

public:
    // Construct all engines of the configuration. The engine
    // constructors are taken from the registry.
    RadiativeTransfer(const SettingsRT& settings,
                      const EngineRegistry& registry);
    RadiativeTransfer(const RadiativeTransfer&) = delete;
    auto operator=(const RadiativeTransfer&) -> RadiativeTransfer& = delete;

    // Prior mean of the state vector
    [[nodiscard]] auto xa() const -> Eigen::VectorXd;
    // Prior covariance, diagonal with the squared prior sigmas
    [[nodiscard]] auto Sa() const -> Eigen::MatrixXd;

    // Return the quantities (transm_up_dir, sphalb, ...) that all
    // engines provide, concatenated in wavelength order.
    [[nodiscard]] auto getSharedRTMQuantities(const Eigen::VectorXd& x_RT,
                                              const Geometry& geom) const
      -> Quantities;
    // Merge the results of all engines, in engine order. Only the
    // keys common to all engines are kept. If any engine gives a
    // placeholder for a key then so does the merged result.
    [[nodiscard]] auto packQuantities(
      const std::vector<Quantities>& per_engine) const -> Quantities;

    // Cosine of the top-of-atmosphere solar zenith angle. A value
    // cached by an engine takes priority over the geometry.
    [[nodiscard]] auto cosZenith(const Geometry& geom) const -> double;

    // All quantities needed for the radiance and its derivatives,
    // from a single query of each engine
    [[nodiscard]] auto evaluate(const Eigen::VectorXd& x_RT,
                                const Geometry& geom) const -> RTEvaluation;

    // Physics-based forward model of the at-sensor radiance including
    // topography, background reflectance, and thermal emission.
    [[nodiscard]] auto calcRdn(const Eigen::VectorXd& x_RT,
                               const Eigen::ArrayXd& rfl_dir,
                               const Eigen::ArrayXd& rfl_dif,
                               const Eigen::ArrayXd& Ls,
                               const Geometry& geom) const -> Eigen::ArrayXd;

    // Conversion between radiance and reflectance. If solar_irr is not
    // given the irradiance of all engines is used.
    [[nodiscard]] auto rdnToRho(
      const Eigen::ArrayXd& rdn,
      const double coszen,
      const std::optional<Eigen::ArrayXd>& solar_irr = std::nullopt) const
      -> Eigen::ArrayXd;
    [[nodiscard]] auto rhoToRdn(
      const Eigen::ArrayXd& rho,
      const double coszen,
      const std::optional<Eigen::ArrayXd>& solar_irr = std::nullopt) const
      -> Eigen::ArrayXd;

    // Interpolated atmospheric path radiance
    [[nodiscard]] auto getLAtm(const Eigen::VectorXd& x_RT,
                               const Geometry& geom) const -> Eigen::ArrayXd;
    // Interpolated total, direct, and diffuse downward radiance. The
    // thermal downwelling of emissive engines already includes the
    // transmission and is counted as diffuse.
    [[nodiscard]] auto getLDownTransmitted(const Eigen::VectorXd& x_RT,
                                           const Geometry& geom) const
      -> DownwellingRadiance;

    // Engine summaries, one per line
    [[nodiscard]] auto summarize(const Eigen::VectorXd& x_RT,
                                 const Geometry& geom) const -> std::string;

    [[nodiscard]] auto wl() const -> const Eigen::ArrayXd& { return wl_; }
    [[nodiscard]] auto solarIrr() const -> const Eigen::ArrayXd&
    {
        return solar_irr_;
    }
    [[nodiscard]] auto nWavelengths() const -> int
    {
        return static_cast<int>(wl_.size());
    }
    [[nodiscard]] auto nEngines() const -> int
    {
        return static_cast<int>(engines.size());
    }
    [[nodiscard]] auto engine(const int i) const -> const Engine&
    {
        return *engines.at(i);
    }
    [[nodiscard]] auto statevecNames() const -> const std::vector<std::string>&
    {
        return statevec_names;
    }
    // Names and prior sigmas of the unknowns
    [[nodiscard]] auto bvecNames() const -> const std::vector<std::string>&
    {
        return bvec;
    }
    [[nodiscard]] auto bval() const -> const Eigen::VectorXd& { return bval_; }
    [[nodiscard]] auto bounds() const -> const ArrayX2d& { return bounds_; }
    [[nodiscard]] auto scale() const -> const Eigen::VectorXd&
    {
        return scale_;
    }
    [[nodiscard]] auto init() const -> const Eigen::VectorXd& { return init_; }
    [[nodiscard]] auto topographyModel() const -> bool
    {
        return topography_model_;
    }
    [[nodiscard]] auto glintModel() const -> bool { return glint_model_; }
    // Finite difference step of the Jacobians
    [[nodiscard]] auto eps() const -> double { return eps_; }
    ~RadiativeTransfer() = default;
};

} // namespace rtcomp
