#pragma once

#include <common/eigen.h>
#include <rt/radiative_transfer.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

// Error of an engine that is not a std::exception, like errors
// raised by some interpolation backends
struct EngineFailure
{
    double x {};
};

// Engine with tabulated quantities that do not depend on geometry.
// The path reflectance (rhoatm) depends linearly on the first element
// of the radiative transfer state:
//   rhoatm = value + slope * x_RT(0).
class TestEngine : public rtcomp::Engine
{
public:
    rtcomp::Quantities quantities {};
    double slope {};
    std::optional<double> coszen {};
    // The query fails with EngineFailure if x_RT(0) exceeds this
    std::optional<double> fail_above {};
    // Length of x_RT of every summarize call
    mutable std::vector<Eigen::Index> summarized_sizes {};

    [[nodiscard]] auto cachedCosZenith() const -> std::optional<double> override
    {
        return coszen;
    }

    [[nodiscard]] auto summarize(const Eigen::VectorXd& x_RT,
                                 const rtcomp::Geometry& geom) const
      -> std::string override
    {
        summarized_sizes.push_back(x_RT.size());
        return Engine::summarize(x_RT, geom);
    }

    [[nodiscard]] auto get(const Eigen::VectorXd& x_RT,
                           const rtcomp::Geometry& /* geom */) const
      -> rtcomp::Quantities override
    {
        if (fail_above && x_RT.size() > 0 && x_RT(0) > *fail_above) {
            throw EngineFailure { x_RT(0) };
        }
        rtcomp::Quantities result { quantities };
        const auto it { result.find("rhoatm") };
        if (x_RT.size() > 0 && it != result.end() && it->second.size() > 0) {
            it->second += slope * x_RT(0);
        }
        return result;
    }
};

// Construct a TestEngine from the engine section of a configuration.
// Recognized keys (all optional except the wavelength range):
//   wl_start, wl_end, n_wl - wavelength grid [nm]
//   solar_irr - constant solar irradiance (default 1)
//   value - value of all quantities (default 1)
//   sphalb - value of the spherical albedo (default value)
//   slope - sensitivity of rhoatm to x_RT(0) (default 0)
//   rt_mode - radiance or transmittance (default radiance)
//   drop - quantities not provided
//   placeholders - quantities provided as empty arrays
//   n_x_RT - length of indices_x_RT (default statevector length)
//   emissive, glint_model, topography_model - flags
//   coszen - cosine of the solar zenith angle stored with the LUT
//   fail_above - upper limit of x_RT(0) for a successful query
auto makeTestEngine(const rtcomp::EngineParams& params)
  -> std::unique_ptr<rtcomp::Engine>
{
    const YAML::Node& node { params.config };
    auto engine { std::make_unique<TestEngine>() };
    const int n_wl { node["n_wl"].as<int>() };
    engine->wl = Eigen::ArrayXd::LinSpaced(
      n_wl, node["wl_start"].as<double>(), node["wl_end"].as<double>());
    engine->solar_irr =
      Eigen::ArrayXd::Constant(n_wl, node["solar_irr"].as<double>(1.0));
    const double value { node["value"].as<double>(1.0) };
    for (const std::string name : { "rhoatm",
                                    "transm_down_dir",
                                    "transm_down_dif",
                                    "transm_up_dir",
                                    "transm_up_dif",
                                    "thermal_upwelling",
                                    "thermal_downwelling",
                                    "dir-dir",
                                    "dif-dir",
                                    "dir-dif",
                                    "dif-dif" }) {
        engine->quantities[name] = Eigen::ArrayXd::Constant(n_wl, value);
    }
    engine->quantities["sphalb"] =
      Eigen::ArrayXd::Constant(n_wl, node["sphalb"].as<double>(value));
    for (const auto& name :
         node["drop"].as<std::vector<std::string>>(std::vector<std::string> {})) {
        engine->quantities.erase(name);
    }
    for (const auto& name : node["placeholders"].as<std::vector<std::string>>(
           std::vector<std::string> {})) {
        engine->quantities[name] = Eigen::ArrayXd {};
    }
    engine->slope = node["slope"].as<double>(0.0);
    engine->rt_mode = node["rt_mode"].as<std::string>("radiance") == "radiance"
                        ? rtcomp::RTMode::radiance
                        : rtcomp::RTMode::transmittance;
    engine->treat_as_emissive = node["emissive"].as<bool>(false);
    engine->glint_model = node["glint_model"].as<bool>(false);
    engine->topography_model = node["topography_model"].as<bool>(false);
    if (node["coszen"]) {
        engine->coszen = node["coszen"].as<double>();
    }
    if (node["fail_above"]) {
        engine->fail_above = node["fail_above"].as<double>();
    }
    engine->indices_x_RT.resize(node["n_x_RT"].as<size_t>(
      params.statevector_names.size()));
    for (size_t i {}; i < engine->indices_x_RT.size(); ++i) {
        engine->indices_x_RT[i] = static_cast<int>(i);
    }
    return engine;
}

// Registry where the test engine is bound to the modtran, sRTMnet,
// and KernelFlowsGP names. The remaining names are left unbound.
auto testRegistry() -> rtcomp::EngineRegistry
{
    rtcomp::EngineRegistry registry {};
    registry.bind(rtcomp::EngineType::modtran, makeTestEngine);
    registry.bind(rtcomp::EngineType::srtmnet, makeTestEngine);
    registry.bind(rtcomp::EngineType::kernel_flows_gp, makeTestEngine);
    return registry;
}

// Settings from a YAML document held in a string
auto settingsFromString(const std::string& yaml) -> rtcomp::SettingsRT
{
    rtcomp::SettingsRT settings { YAML::Load(yaml) };
    settings.init();
    return settings;
}

// Construct the radiative transfer model with the test engines
auto makeRT(const std::string& yaml) -> std::unique_ptr<rtcomp::RadiativeTransfer>
{
    return std::make_unique<rtcomp::RadiativeTransfer>(
      settingsFromString(yaml), testRegistry());
}

// Write a string into a file in the temporary directory and return
// the full path.
auto writeTmpFile(const std::string& filename,
                  const std::string& contents) -> std::string
{
    const std::filesystem::path path { std::filesystem::temp_directory_path()
                                       / filename };
    std::ofstream out { path };
    out << contents;
    return path.string();
}
