// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Structured entries of the radiative transfer configuration: state
// vector elements, unknowns (nuisance parameters), and engine
// sections. Each declares yaml_type so that it can be stored in a
// Setting and read by the YAML library.

#pragma once

#include "engine.h"

#include <array>
#include <string>
#include <yaml-cpp/yaml.h>

namespace rtcomp {

// A free parameter of the radiative transfer model
struct StateVectorElement
{
    static constexpr const char* yaml_type { "state vector element" };
    std::string name {};
    std::array<double, 2> bounds {};
    double scale { 1.0 };
    double init {};
    double prior_mean {};
    double prior_sigma {};
};

// A parameter that is not retrieved but whose uncertainty
// contributes to the error budget
struct UnknownElement
{
    static constexpr const char* yaml_type { "unknown" };
    std::string name {};
    double sigma {};
};

// Engine section of the configuration. Besides the engine name and
// the engine level options the full YAML node is retained for keys
// that only a particular engine understands.
struct EngineConfig
{
    static constexpr const char* yaml_type { "engine configuration" };
    std::string engine_name {};
    EngineOptions options {};
    YAML::Node node {};
};

auto operator<<(YAML::Emitter& out,
                const StateVectorElement& element) -> YAML::Emitter&;
auto operator<<(YAML::Emitter& out,
                const UnknownElement& element) -> YAML::Emitter&;
auto operator<<(YAML::Emitter& out,
                const EngineConfig& engine) -> YAML::Emitter&;

} // namespace rtcomp

namespace YAML {

template <>
struct convert<rtcomp::StateVectorElement>
{
    static auto decode(const Node& node,
                       rtcomp::StateVectorElement& rhs) -> bool;
};

template <>
struct convert<rtcomp::UnknownElement>
{
    static auto decode(const Node& node, rtcomp::UnknownElement& rhs) -> bool;
};

template <>
struct convert<rtcomp::EngineConfig>
{
    static auto decode(const Node& node, rtcomp::EngineConfig& rhs) -> bool;
};

} // namespace YAML
