// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "state_vector.h"

#include <common/yaml.h>

namespace YAML {

auto convert<rtcomp::StateVectorElement>::decode(
  const Node& node,
  rtcomp::StateVectorElement& rhs) -> bool
{
    if (!node.IsMap() || !node["name"]) {
        return false;
    }
    rhs.name = node["name"].as<std::string>();
    if (node["bounds"]) {
        const auto bounds { node["bounds"].as<std::vector<double>>() };
        if (bounds.size() != 2) {
            throw std::invalid_argument { "bounds of " + rhs.name
                                          + " must have two values" };
        }
        rhs.bounds = { bounds.front(), bounds.back() };
    }
    if (node["scale"]) {
        rhs.scale = node["scale"].as<double>();
    }
    if (node["init"]) {
        rhs.init = node["init"].as<double>();
    }
    if (node["prior_mean"]) {
        rhs.prior_mean = node["prior_mean"].as<double>();
    }
    if (node["prior_sigma"]) {
        rhs.prior_sigma = node["prior_sigma"].as<double>();
    }
    return true;
}

auto convert<rtcomp::UnknownElement>::decode(const Node& node,
                                             rtcomp::UnknownElement& rhs)
  -> bool
{
    if (!node.IsMap() || !node["name"]) {
        return false;
    }
    rhs.name = node["name"].as<std::string>();
    if (node["sigma"]) {
        rhs.sigma = node["sigma"].as<double>();
    }
    return true;
}

auto convert<rtcomp::EngineConfig>::decode(const Node& node,
                                           rtcomp::EngineConfig& rhs) -> bool
{
    if (!node.IsMap() || !node["engine_name"]) {
        return false;
    }
    rhs.engine_name = node["engine_name"].as<std::string>();
    rhs.options.interpolator_style =
      node["interpolator_style"].as<std::optional<std::string>>(std::nullopt);
    rhs.options.overwrite_interpolator =
      node["overwrite_interpolator"].as<std::optional<bool>>(std::nullopt);
    if (node["lut_grid"]) {
        rhs.options.lut_grid =
          node["lut_grid"].as<std::map<std::string, std::vector<double>>>();
    }
    rhs.options.lut_path =
      node["lut_path"].as<std::optional<std::string>>(std::nullopt);
    rhs.options.wavelength_file =
      node["wavelength_file"].as<std::optional<std::string>>(std::nullopt);
    rhs.node = YAML::Clone(node);
    return true;
}

} // namespace YAML

namespace rtcomp {

auto operator<<(YAML::Emitter& out,
                const StateVectorElement& element) -> YAML::Emitter&
{
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << element.name;
    out << YAML::Key << "bounds" << YAML::Value << YAML::Flow
        << YAML::BeginSeq << element.bounds[0] << element.bounds[1]
        << YAML::EndSeq;
    out << YAML::Key << "scale" << YAML::Value << element.scale;
    out << YAML::Key << "init" << YAML::Value << element.init;
    out << YAML::Key << "prior_mean" << YAML::Value << element.prior_mean;
    out << YAML::Key << "prior_sigma" << YAML::Value << element.prior_sigma;
    out << YAML::EndMap;
    return out;
}

auto operator<<(YAML::Emitter& out,
                const UnknownElement& element) -> YAML::Emitter&
{
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << element.name;
    out << YAML::Key << "sigma" << YAML::Value << element.sigma;
    out << YAML::EndMap;
    return out;
}

auto operator<<(YAML::Emitter& out,
                const EngineConfig& engine) -> YAML::Emitter&
{
    if (engine.node.IsMap()) {
        out << engine.node;
    } else {
        out << YAML::BeginMap;
        out << YAML::Key << "engine_name" << YAML::Value << engine.engine_name;
        out << YAML::EndMap;
    }
    return out;
}

} // namespace rtcomp
