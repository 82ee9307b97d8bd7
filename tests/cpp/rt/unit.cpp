// Unit tests for the radiative transfer compositor

#include "../testing.h"

#include <common/constants.h>
#include <rt/coupled_radiance.h>
#include <rt/jacobian.h>
#include <rt/physics.h>

#include <cmath>
#include <numbers>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// Two engines with disjoint spectral ranges, listed in reverse
// wavelength order
const std::string two_engine_config {
    R"(
radiative_transfer:
  statevector:
    - { name: H2OSTR, bounds: [0.1, 5.0], init: 1.5, prior_mean: 1.4, prior_sigma: 2.0 }
    - { name: AOT550, bounds: [0.001, 1.0], init: 0.1, prior_mean: 0.2, prior_sigma: 0.5 }
  unknowns:
    - { name: H2O_ABSCO, sigma: 0.01 }
  radiative_transfer_engines:
    - { engine_name: sRTMnet, wl_start: 1000, wl_end: 1090, n_wl: 10, value: 2.0, sphalb: 1.0, solar_irr: 2.0 }
    - { engine_name: modtran, wl_start: 400, wl_end: 490, n_wl: 10, value: 1.0, sphalb: 0.0, solar_irr: 3.0 }
)"
};

TEST_CASE("unit tests")
{
    // Initialize data
    const rtcomp::Geometry nadir {};
    const auto rt { makeRT(two_engine_config) };
    const Eigen::VectorXd x_RT { rt->init() };
    const int n_wl { rt->nWavelengths() };

    // Run all tests

    SECTION("Engine names")
    {
        CHECK(rtcomp::engineTypeFromString("6s") == rtcomp::EngineType::six_s);
        CHECK(rtcomp::engineTypeFromString("sRTMnet")
              == rtcomp::EngineType::srtmnet);
        CHECK(rtcomp::engineTypeToString(rtcomp::EngineType::kernel_flows_gp)
              == "KernelFlowsGP");
        CHECK(rtcomp::engineNames().size() == 5);
        CHECK_THROWS_AS(rtcomp::engineTypeFromString("MODTRAN"),
                        std::invalid_argument);
        CHECK_THROWS_WITH(rtcomp::engineTypeFromString("unknown"),
                          ContainsSubstring("Got: unknown")
                            && ContainsSubstring("libradtran"));
    }

    SECTION("Engine registry")
    {
        const rtcomp::EngineRegistry registry { testRegistry() };
        CHECK(registry.isBound(rtcomp::EngineType::modtran));
        CHECK(!registry.isBound(rtcomp::EngineType::six_s));
        rtcomp::EngineParams params {};
        params.engine_name = "6s";
        CHECK_THROWS_AS(registry.create(params), std::runtime_error);
    }

    SECTION("Option priority")
    {
        rtcomp::EngineOptions engine {};
        rtcomp::EngineOptions instrument {};
        rtcomp::EngineOptions global {};
        engine.lut_path = "engine.nc";
        instrument.lut_path = "instrument.nc";
        instrument.interpolator_style = "mlg";
        global.interpolator_style = "rg";
        global.overwrite_interpolator = true;
        global.lut_grid["AOT550"] = { 0.1, 0.5 };
        const rtcomp::EngineOptions merged { rtcomp::mergeOptions(
          { engine, instrument, global }) };
        CHECK(merged.lut_path == "engine.nc");
        CHECK(merged.interpolator_style == "mlg");
        CHECK(merged.overwrite_interpolator == true);
        CHECK(merged.lut_grid.at("AOT550").size() == 2);
        CHECK(!merged.wavelength_file);
    }

    SECTION("Engines are sorted by wavelength")
    {
        REQUIRE(rt->nEngines() == 2);
        CHECK_THAT(rt->engine(0).wl(0), WithinRel(400.0, 1e-12));
        CHECK_THAT(rt->engine(1).wl(0), WithinRel(1000.0, 1e-12));
        REQUIRE(n_wl == 20);
        for (int i { 1 }; i < n_wl; ++i) {
            CHECK(rt->wl()(i) > rt->wl()(i - 1));
        }
        CHECK_THAT(rt->solarIrr()(0), WithinRel(3.0, 1e-12));
        CHECK_THAT(rt->solarIrr()(n_wl - 1), WithinRel(2.0, 1e-12));
    }

    SECTION("Engines are summarized only at a state")
    {
        // Construction logs the static description
        const auto& engine { dynamic_cast<const TestEngine&>(rt->engine(0)) };
        CHECK(engine.summarized_sizes.empty());
        CHECK_THAT(engine.describe(), ContainsSubstring("400 nm"));
        const std::string summary { rt->summarize(x_RT, nadir) };
        REQUIRE(engine.summarized_sizes.size() == 1);
        CHECK(engine.summarized_sizes[0] == 2);
        CHECK_THAT(summary, ContainsSubstring("1000 nm"));
    }

    SECTION("State vector and prior")
    {
        CHECK(rt->statevecNames()
              == std::vector<std::string> { "H2OSTR", "AOT550" });
        CHECK_THAT(rt->xa()(1), WithinRel(0.2, 1e-12));
        const Eigen::MatrixXd Sa { rt->Sa() };
        CHECK_THAT(Sa(0, 0), WithinRel(4.0, 1e-12));
        CHECK_THAT(Sa(1, 1), WithinRel(0.25, 1e-12));
        CHECK_THAT(Sa(0, 1), WithinAbs(0.0, 1e-15));
        CHECK_THAT(rt->bounds()(0, 1), WithinRel(5.0, 1e-12));
        CHECK(rt->bvecNames() == std::vector<std::string> { "H2O_ABSCO" });
        CHECK_THAT(rt->bval()(0), WithinRel(0.01, 1e-12));
    }

    SECTION("Merge of engine results")
    {
        rtcomp::Quantities a {};
        rtcomp::Quantities b {};
        a["rhoatm"] = Eigen::ArrayXd::Constant(2, 1.0);
        a["sphalb"] = Eigen::ArrayXd::Constant(2, 0.1);
        a["only_a"] = Eigen::ArrayXd::Constant(2, 5.0);
        a["thermal_upwelling"] = Eigen::ArrayXd {};
        b["rhoatm"] = Eigen::ArrayXd::Constant(3, 2.0);
        b["sphalb"] = Eigen::ArrayXd::Constant(3, 0.2);
        b["thermal_upwelling"] = Eigen::ArrayXd::Constant(3, 7.0);
        const rtcomp::Quantities merged { rt->packQuantities({ a, b }) };
        CHECK(merged.size() == 3);
        CHECK(!merged.contains("only_a"));
        REQUIRE(merged.at("rhoatm").size() == 5);
        CHECK_THAT(merged.at("rhoatm")(1), WithinRel(1.0, 1e-12));
        CHECK_THAT(merged.at("rhoatm")(2), WithinRel(2.0, 1e-12));
        CHECK_THAT(merged.at("sphalb")(4), WithinRel(0.2, 1e-12));
        // A placeholder in any engine gives a placeholder
        CHECK(merged.at("thermal_upwelling").size() == 0);
        // Repeated merges give the same result
        CHECK(rt->packQuantities({ a, b }).size() == 3);
        CHECK(rt->packQuantities({}).empty());
    }

    SECTION("Shared quantities")
    {
        const rtcomp::Quantities r { rt->getSharedRTMQuantities(x_RT, nadir) };
        REQUIRE(r.at("transm_up_dir").size() == n_wl);
        CHECK_THAT(r.at("transm_up_dir")(0), WithinRel(1.0, 1e-12));
        CHECK_THAT(r.at("transm_up_dir")(n_wl - 1), WithinRel(2.0, 1e-12));
        CHECK_THAT(r.at("sphalb")(n_wl - 1), WithinRel(1.0, 1e-12));
    }

    SECTION("Coupled radiance")
    {
        rtcomp::Quantities r {};
        r["dir-dir"] = Eigen::ArrayXd::Constant(3, 1.0);
        r["dif-dir"] = Eigen::ArrayXd::Constant(3, 2.0);
        r["dir-dif"] = Eigen::ArrayXd::Constant(3, 3.0);
        r["dif-dif"] = Eigen::ArrayXd::Constant(3, 4.0);
        r["transm_down_dir"] = Eigen::ArrayXd::Constant(3, 0.5);
        r["transm_down_dif"] = Eigen::ArrayXd::Constant(3, 0.25);
        const std::vector<std::string> terms {
            "dir-dir", "dif-dir", "dir-dif", "dif-dif"
        };
        const Eigen::ArrayXd scaling { Eigen::ArrayXd::Constant(3, 10.0) };
        const rtcomp::CoupledRadiance L_flat { rtcomp::coupledRadiance(
          r, terms, scaling, 0.5, 0.5) };
        CHECK_THAT(L_flat.bi_direct(0), WithinRel(10.0, 1e-12));
        CHECK_THAT(L_flat.hemi_direct(1), WithinRel(20.0, 1e-12));
        CHECK_THAT(L_flat.direct_hemi(2), WithinRel(30.0, 1e-12));
        CHECK_THAT(L_flat.bi_hemi(0), WithinRel(40.0, 1e-12));
        // Sloped surface: only the direct terms change
        const rtcomp::CoupledRadiance L_slope { rtcomp::coupledRadiance(
          r, terms, scaling, 0.5, 0.25) };
        CHECK_THAT(L_slope.bi_direct(0), WithinRel(5.0, 1e-12));
        CHECK_THAT(L_slope.hemi_direct(0), WithinRel(20.0, 1e-12));
        CHECK_THAT(L_slope.direct_hemi(0), WithinRel(15.0, 1e-12));
        CHECK_THAT(L_slope.bi_hemi(0), WithinRel(40.0, 1e-12));
        // Missing coupling term: two term model
        r["dif-dif"] = Eigen::ArrayXd {};
        const rtcomp::CoupledRadiance L_two { rtcomp::coupledRadiance(
          r, terms, scaling, 0.5, 0.5) };
        CHECK_THAT(L_two.bi_direct(0), WithinRel(0.5, 1e-12));
        CHECK_THAT(L_two.hemi_direct(0), WithinRel(0.75, 1e-12));
        CHECK_THAT(L_two.direct_hemi(0), WithinAbs(0.0, 1e-15));
        CHECK_THAT(L_two.bi_hemi(0), WithinAbs(0.0, 1e-15));
    }

    SECTION("Radiance")
    {
        // Radiance mode engines, zenith sun, unit coupling terms:
        //   rdn = rhoatm + value * 2 * (rfl_dir + rfl_dif) / (1 - sphalb *
        //   rfl_dif)
        const Eigen::ArrayXd rfl { Eigen::ArrayXd::Constant(n_wl, 0.5) };
        const Eigen::ArrayXd Ls { Eigen::ArrayXd::Zero(n_wl) };
        const Eigen::ArrayXd rdn { rt->calcRdn(x_RT, rfl, rfl, Ls, nadir) };
        REQUIRE(rdn.size() == n_wl);
        CHECK_THAT(rdn(0), WithinRel(1.0 + 2.0 / 1.0, 1e-12));
        CHECK_THAT(rdn(n_wl - 1), WithinRel(2.0 + 4.0 / 0.5, 1e-12));
        // Surface emission is transmitted upward
        const Eigen::ArrayXd Ls_one { Eigen::ArrayXd::Ones(n_wl) };
        const Eigen::ArrayXd rdn_thermal { rt->calcRdn(
          x_RT, rfl, rfl, Ls_one, nadir) };
        CHECK_THAT(rdn_thermal(0) - rdn(0), WithinRel(2.0, 1e-12));
        // Same inputs, same result
        const Eigen::ArrayXd rdn_again { rt->calcRdn(x_RT, rfl, rfl, Ls, nadir) };
        CHECK((rdn_again == rdn).all());
        // Inconsistent array lengths
        const Eigen::ArrayXd short_rfl { Eigen::ArrayXd::Constant(3, 0.5) };
        CHECK_THROWS_AS(rt->calcRdn(x_RT, short_rfl, rfl, Ls, nadir),
                        std::invalid_argument);
    }

    SECTION("Background reflectance")
    {
        rtcomp::Geometry geom {};
        geom.bg_rfl = Eigen::ArrayXd::Zero(n_wl);
        const Eigen::ArrayXd rfl { Eigen::ArrayXd::Constant(n_wl, 0.5) };
        const Eigen::ArrayXd Ls { Eigen::ArrayXd::Zero(n_wl) };
        const Eigen::ArrayXd rdn { rt->calcRdn(x_RT, rfl, rfl, Ls, geom) };
        // Only the upward direct terms see the target
        CHECK_THAT(rdn(0), WithinRel(1.0 + 1.0, 1e-12));
        CHECK_THAT(rdn(n_wl - 1), WithinRel(2.0 + 2.0, 1e-12));
    }

    SECTION("Path and downwelling radiance")
    {
        const Eigen::ArrayXd L_atm { rt->getLAtm(x_RT, nadir) };
        CHECK_THAT(L_atm(0), WithinRel(1.0, 1e-12));
        CHECK_THAT(L_atm(n_wl - 1), WithinRel(2.0, 1e-12));
        const rtcomp::DownwellingRadiance L_down { rt->getLDownTransmitted(
          x_RT, nadir) };
        CHECK_THAT(L_down.total(0), WithinRel(2.0, 1e-12));
        CHECK_THAT(L_down.dir(n_wl - 1), WithinRel(2.0, 1e-12));
        CHECK_THAT(L_down.dif(n_wl - 1), WithinRel(2.0, 1e-12));
    }

    SECTION("Radiance and reflectance")
    {
        const double coszen { std::cos(30.0 * rtcomp::math::deg_to_rad) };
        const Eigen::ArrayXd rho { Eigen::ArrayXd::LinSpaced(n_wl, 0.1, 0.9) };
        const Eigen::ArrayXd rdn { rt->rhoToRdn(rho, coszen) };
        CHECK_THAT(rdn(0), WithinRel(3.0 * coszen / std::numbers::pi * 0.1, 1e-12));
        const Eigen::ArrayXd rho_back { rt->rdnToRho(rdn, coszen) };
        for (int i {}; i < n_wl; ++i) {
            CHECK_THAT(rho_back(i), WithinRel(rho(i), 1e-12));
        }
        const Eigen::ArrayXd irr { Eigen::ArrayXd::Constant(2, std::numbers::pi) };
        const Eigen::ArrayXd rho_2 { Eigen::ArrayXd::Constant(2, 0.5) };
        CHECK_THAT(rt->rhoToRdn(rho_2, 1.0, irr)(1), WithinRel(0.5, 1e-12));
        CHECK_THROWS_AS(rt->rdnToRho(rho_2, 1.0), std::invalid_argument);
    }

    SECTION("Cosine of the solar zenith angle")
    {
        rtcomp::Geometry geom {};
        geom.solar_zenith = 60.0;
        CHECK_THAT(rt->cosZenith(geom), WithinRel(0.5, 1e-12));
        const rtcomp::RTEvaluation ev { rt->evaluate(x_RT, geom) };
        CHECK_THAT(ev.cos_i, WithinRel(0.5, 1e-12));
        geom.cos_i = 0.25;
        CHECK_THAT(rt->evaluate(x_RT, geom).cos_i, WithinRel(0.25, 1e-12));
    }

    SECTION("Forward difference")
    {
        const auto f { [](const Eigen::VectorXd& x) -> Eigen::ArrayXd {
            return x.array().square();
        } };
        const Eigen::VectorXd x { Eigen::VectorXd::Constant(2, 3.0) };
        const Eigen::ArrayXd d { rtcomp::forwardDifference(
          f, x, f(x), Eigen::VectorXd::Unit(2, 1), 1e-6) };
        CHECK_THAT(d(0), WithinAbs(0.0, 1e-12));
        CHECK_THAT(d(1), WithinAbs(6.0, 1e-5));
    }

    SECTION("Physics")
    {
        CHECK_THAT(rtcomp::fresnelReflectanceFactor(0.0), WithinRel(0.02, 1e-12));
        CHECK_THAT(rtcomp::fresnelReflectanceFactor(1e-3),
                   WithinRel(0.0200593122, 1e-6));
        CHECK_THAT(rtcomp::fresnelReflectanceFactor(40.0),
                   WithinRel(0.0241519624, 1e-6));
        CHECK_THAT(rtcomp::ext550ToVis(0.0), WithinRel(337.534340417, 1e-8));
    }
}
