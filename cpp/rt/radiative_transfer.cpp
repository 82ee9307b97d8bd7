// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "radiative_transfer.h"

#include <common/constants.h>
#include <common/io.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numbers>
#include <set>
#include <spdlog/spdlog.h>

namespace rtcomp {

// Concatenate per-engine arrays in engine order
static auto concatenate(const std::vector<Eigen::ArrayXd>& segments)
  -> Eigen::ArrayXd
{
    Eigen::Index n_total {};
    for (const auto& segment : segments) {
        n_total += segment.size();
    }
    Eigen::ArrayXd result(n_total);
    Eigen::Index offset {};
    for (const auto& segment : segments) {
        result.segment(offset, segment.size()) = segment;
        offset += segment.size();
    }
    return result;
}

RadiativeTransfer::RadiativeTransfer(const SettingsRT& settings,
                                     const EngineRegistry& registry)
  : statevec_names { settings.statevectorNames() },
    eps_ { settings.jacobian.eps }
{
    const auto& engine_configs { settings.radiative_transfer.engines };
    if (engine_configs.empty()) {
        const std::string msg { "no radiative transfer engines configured" };
        spdlog::error(msg);
        throw std::runtime_error { msg };
    }
    for (const EngineConfig& engine_config : engine_configs) {
        EngineParams params {
            .engine_name = engine_config.engine_name,
            .options = settings.engineOptions(engine_config),
            .statevector_names = statevec_names,
            .config = engine_config.node,
        };
        // Validate the name first so that the error lists the
        // supported engines.
        try {
            static_cast<void>(engineTypeFromString(params.engine_name));
        } catch (const std::invalid_argument& e) {
            spdlog::error(e.what());
            throw;
        }
        auto engine { registry.create(params) };
        // The number of state vector elements must match what the
        // engine expects.
        const size_t expected { statevec_names.size() };
        const size_t got { engine->indices_x_RT.size() };
        if (expected != got) {
            const std::string msg {
                "Mismatch between the number of elements for the config "
                "statevector and LUT.indices.x_RT: expected="
                + std::to_string(expected) + ", got=" + std::to_string(got)
            };
            spdlog::error(msg);
            throw std::runtime_error { msg };
        }
        if (engine->wl.size() == 0
            || engine->wl.size() != engine->solar_irr.size()) {
            const std::string msg { params.engine_name
                                    + " engine: the wavelength grid must be "
                                      "nonempty and match the solar "
                                      "irradiance" };
            spdlog::error(msg);
            throw std::runtime_error { msg };
        }
        engines.push_back(std::move(engine));
    }

    // If any engine has it, the model has it
    topography_model_ = std::ranges::any_of(
      engines, [](const auto& engine) { return engine->topography_model; });
    glint_model_ = std::ranges::any_of(
      engines, [](const auto& engine) { return engine->glint_model; });

    // The rest of the code relies on the engines being sorted by
    // wavelength which the configuration order does not guarantee.
    std::ranges::stable_sort(engines, [](const auto& a, const auto& b) {
        return a->wl(0) < b->wl(0);
    });
    for (size_t i_engine { 1 }; i_engine < engines.size(); ++i_engine) {
        const auto& prev_wl { engines[i_engine - 1]->wl };
        if (engines[i_engine]->wl(0) <= prev_wl(prev_wl.size() - 1)) {
            spdlog::warn("wavelength ranges of radiative transfer engines {} "
                         "and {} overlap",
                         i_engine - 1,
                         i_engine);
        }
    }

    printHeading("Radiative transfer engines");
    std::vector<Eigen::ArrayXd> wl_segments {};
    std::vector<Eigen::ArrayXd> irr_segments {};
    for (size_t i_engine {}; i_engine < engines.size(); ++i_engine) {
        const Engine& engine { *engines[i_engine] };
        spdlog::info("Radiative transfer engine {}: {}",
                     i_engine,
                     engine.describe());
        wl_segments.push_back(engine.wl);
        irr_segments.push_back(engine.solar_irr);
    }
    wl_ = concatenate(wl_segments);
    solar_irr_ = concatenate(irr_segments);
    spdlog::info("Topography model: {}, glint model: {}",
                 topography_model_,
                 glint_model_);

    // Retrieved variables. Bounds, scaling, initial guess, and prior
    // of each state vector element are taken from the configuration.
    const auto& statevector { settings.radiative_transfer.statevector };
    const auto n_sv { static_cast<Eigen::Index>(statevector.size()) };
    bounds_.resize(n_sv, 2);
    scale_.resize(n_sv);
    init_.resize(n_sv);
    prior_mean.resize(n_sv);
    prior_sigma.resize(n_sv);
    for (Eigen::Index i {}; i < n_sv; ++i) {
        const StateVectorElement& element { statevector[i] };
        bounds_(i, 0) = element.bounds[0];
        bounds_(i, 1) = element.bounds[1];
        scale_(i) = element.scale;
        init_(i) = element.init;
        prior_mean(i) = element.prior_mean;
        prior_sigma(i) = element.prior_sigma;
    }

    const auto& unknowns { settings.radiative_transfer.unknowns };
    bval_.resize(static_cast<Eigen::Index>(unknowns.size()));
    for (size_t i {}; i < unknowns.size(); ++i) {
        bvec.push_back(unknowns[i].name);
        bval_(static_cast<Eigen::Index>(i)) = unknowns[i].sigma;
    }
}

auto RadiativeTransfer::xa() const -> Eigen::VectorXd
{
    return prior_mean;
}

auto RadiativeTransfer::Sa() const -> Eigen::MatrixXd
{
    return prior_sigma.array().square().matrix().asDiagonal();
}

auto RadiativeTransfer::queryEngines(const Eigen::VectorXd& x_RT,
                                     const Geometry& geom) const
  -> std::vector<Quantities>
{
    std::vector<Quantities> results {};
    results.reserve(engines.size());
    for (const auto& engine : engines) {
        results.push_back(engine->get(x_RT, geom));
    }
    return results;
}

auto RadiativeTransfer::packQuantities(
  const std::vector<Quantities>& per_engine) const -> Quantities
{
    if (per_engine.empty()) {
        return {};
    }
    // Intersection of the keys of all engines
    std::set<std::string> shared_keys {};
    std::set<std::string> all_keys {};
    for (const auto& [key, value] : per_engine.front()) {
        shared_keys.insert(key);
    }
    for (const Quantities& quantities : per_engine) {
        std::set<std::string> keys {};
        for (const auto& [key, value] : quantities) {
            keys.insert(key);
            all_keys.insert(key);
        }
        std::erase_if(shared_keys, [&keys](const std::string& key) {
            return !keys.contains(key);
        });
    }
    if (shared_keys.size() < all_keys.size()) {
        std::vector<std::string> dropped {};
        std::ranges::set_difference(
          all_keys, shared_keys, std::back_inserter(dropped));
        bool first_time { false };
        std::call_once(merge_warning, [&first_time] { first_time = true; });
        const std::string msg {
            "quantities not provided by all radiative transfer engines are "
            "dropped: "
            + joinStrings(dropped, ", ")
        };
        if (first_time) {
            spdlog::warn(msg);
        } else {
            spdlog::debug(msg);
        }
    }
    // Concatenate the different spectral ranges
    Quantities merged {};
    for (const std::string& key : shared_keys) {
        std::vector<Eigen::ArrayXd> segments {};
        bool placeholder { false };
        for (const Quantities& quantities : per_engine) {
            const Eigen::ArrayXd& value { quantities.at(key) };
            placeholder = placeholder || value.size() == 0;
            segments.push_back(value);
        }
        merged[key] = placeholder ? Eigen::ArrayXd {} : concatenate(segments);
    }
    return merged;
}

auto RadiativeTransfer::getSharedRTMQuantities(const Eigen::VectorXd& x_RT,
                                               const Geometry& geom) const
  -> Quantities
{
    return packQuantities(queryEngines(x_RT, geom));
}

auto RadiativeTransfer::cosZenith(const Geometry& geom) const -> double
{
    for (const auto& engine : engines) {
        if (const auto coszen { engine->cachedCosZenith() }) {
            return *coszen;
        }
    }
    return std::cos(geom.solar_zenith * math::deg_to_rad);
}

auto RadiativeTransfer::couplingScaling(const double coszen) const
  -> Eigen::ArrayXd
{
    std::vector<Eigen::ArrayXd> segments {};
    for (const auto& engine : engines) {
        if (engine->rt_mode == RTMode::transmittance) {
            segments.push_back(engine->solar_irr * coszen / std::numbers::pi);
        } else {
            segments.push_back(Eigen::ArrayXd::Ones(engine->wl.size()));
        }
    }
    return concatenate(segments);
}

auto RadiativeTransfer::pathRadiance(const std::vector<Quantities>& results,
                                     const double coszen) const
  -> Eigen::ArrayXd
{
    std::vector<Eigen::ArrayXd> segments {};
    for (size_t i_engine {}; i_engine < engines.size(); ++i_engine) {
        const Engine& engine { *engines[i_engine] };
        const Quantities& r { results[i_engine] };
        if (engine.treat_as_emissive) {
            segments.push_back(requireQuantity(r, "thermal_upwelling"));
        } else if (engine.rt_mode == RTMode::radiance) {
            segments.push_back(requireQuantity(r, "rhoatm"));
        } else {
            segments.push_back(engine.solar_irr * coszen / std::numbers::pi
                               * requireQuantity(r, "rhoatm"));
        }
    }
    return concatenate(segments);
}

auto RadiativeTransfer::downwelling(const std::vector<Quantities>& results,
                                    const double coszen) const
  -> DownwellingRadiance
{
    std::vector<Eigen::ArrayXd> dir_segments {};
    std::vector<Eigen::ArrayXd> dif_segments {};
    for (size_t i_engine {}; i_engine < engines.size(); ++i_engine) {
        const Engine& engine { *engines[i_engine] };
        const Quantities& r { results[i_engine] };
        if (engine.treat_as_emissive) {
            const Eigen::ArrayXd& L_thermal { requireQuantity(
              r, "thermal_downwelling") };
            dir_segments.push_back(Eigen::ArrayXd::Zero(L_thermal.size()));
            dif_segments.push_back(L_thermal);
        } else if (engine.rt_mode == RTMode::radiance) {
            dir_segments.push_back(requireQuantity(r, "transm_down_dir"));
            dif_segments.push_back(requireQuantity(r, "transm_down_dif"));
        } else {
            // Transform downward transmittance to radiance
            const Eigen::ArrayXd factor { engine.solar_irr * coszen
                                          / std::numbers::pi };
            dir_segments.push_back(factor
                                   * requireQuantity(r, "transm_down_dir"));
            dif_segments.push_back(factor
                                   * requireQuantity(r, "transm_down_dif"));
        }
    }
    DownwellingRadiance L_down {};
    L_down.dir = concatenate(dir_segments);
    L_down.dif = concatenate(dif_segments);
    L_down.total = L_down.dir + L_down.dif;
    return L_down;
}

auto RadiativeTransfer::evaluate(const Eigen::VectorXd& x_RT,
                                 const Geometry& geom) const -> RTEvaluation
{
    RTEvaluation evaluation {};
    evaluation.coszen = cosZenith(geom);
    // Local solar zenith angle as a function of surface slope and aspect
    evaluation.cos_i = geom.cos_i.value_or(evaluation.coszen);
    const std::vector<Quantities> results { queryEngines(x_RT, geom) };
    evaluation.r = packQuantities(results);
    evaluation.L_atm = pathRadiance(results, evaluation.coszen);
    evaluation.L_down = downwelling(results, evaluation.coszen);
    return evaluation;
}

auto RadiativeTransfer::calcRdn(const Eigen::VectorXd& x_RT,
                                const Eigen::ArrayXd& rfl_dir,
                                const Eigen::ArrayXd& rfl_dif,
                                const Eigen::ArrayXd& Ls,
                                const Geometry& geom) const -> Eigen::ArrayXd
{
    const Eigen::Index n_wl { wl_.size() };
    if (rfl_dir.size() != n_wl || rfl_dif.size() != n_wl || Ls.size() != n_wl
        || (geom.bg_rfl && geom.bg_rfl->size() != n_wl)) {
        throw std::invalid_argument {
            "reflectance and emission arrays must have "
            + std::to_string(n_wl) + " elements"
        };
    }
    const double coszen { cosZenith(geom) };
    const double cos_i { geom.cos_i.value_or(coszen) };
    const std::vector<Quantities> results { queryEngines(x_RT, geom) };
    const Quantities r { packQuantities(results) };

    const Eigen::ArrayXd L_atm { pathRadiance(results, coszen) };
    const Eigen::ArrayXd& s_alb { requireQuantity(r, "sphalb") };
    const CoupledRadiance L { coupledRadiance(r,
                                              engines.front()->coupling_terms,
                                              couplingScaling(coszen),
                                              coszen,
                                              cos_i) };
    // Thermal transmittance
    const Eigen::ArrayXd L_up {
        Ls * (requireQuantity(r, "transm_up_dir")
              + requireQuantity(r, "transm_up_dif"))
    };
    // Adjacency effects
    const Eigen::ArrayXd& bg_dir { geom.bg_rfl ? *geom.bg_rfl : rfl_dir };
    const Eigen::ArrayXd& bg_dif { geom.bg_rfl ? *geom.bg_rfl : rfl_dif };

    return L_atm
           + (L.bi_direct * rfl_dir + L.hemi_direct * rfl_dif
              + L.direct_hemi * bg_dir + L.bi_hemi * bg_dif)
               / (1.0 - s_alb * bg_dif)
           + L_up;
}

auto RadiativeTransfer::rdnToRho(
  const Eigen::ArrayXd& rdn,
  const double coszen,
  const std::optional<Eigen::ArrayXd>& solar_irr) const -> Eigen::ArrayXd
{
    const Eigen::ArrayXd& irr { solar_irr ? *solar_irr : solar_irr_ };
    if (irr.size() != rdn.size()) {
        throw std::invalid_argument { "radiance and solar irradiance differ "
                                      "in length" };
    }
    return rdn * std::numbers::pi / (irr * coszen);
}

auto RadiativeTransfer::rhoToRdn(
  const Eigen::ArrayXd& rho,
  const double coszen,
  const std::optional<Eigen::ArrayXd>& solar_irr) const -> Eigen::ArrayXd
{
    const Eigen::ArrayXd& irr { solar_irr ? *solar_irr : solar_irr_ };
    if (irr.size() != rho.size()) {
        throw std::invalid_argument { "reflectance and solar irradiance "
                                      "differ in length" };
    }
    return (irr * coszen) / std::numbers::pi * rho;
}

auto RadiativeTransfer::getLAtm(const Eigen::VectorXd& x_RT,
                                const Geometry& geom) const -> Eigen::ArrayXd
{
    return pathRadiance(queryEngines(x_RT, geom), cosZenith(geom));
}

auto RadiativeTransfer::getLDownTransmitted(const Eigen::VectorXd& x_RT,
                                            const Geometry& geom) const
  -> DownwellingRadiance
{
    return downwelling(queryEngines(x_RT, geom), cosZenith(geom));
}

auto RadiativeTransfer::summarize(const Eigen::VectorXd& x_RT,
                                  const Geometry& geom) const -> std::string
{
    std::vector<std::string> summaries {};
    for (const auto& engine : engines) {
        summaries.push_back(engine->summarize(x_RT, geom));
    }
    return joinStrings(summaries, "\n");
}

} // namespace rtcomp
