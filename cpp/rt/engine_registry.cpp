// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "engine_registry.h"

#include <common/io.h>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace rtcomp {

// Mapping between an engine name and its corresponding entry in
// EngineType
static const std::map<std::string, EngineType> engine_str_to_enum {
    { "modtran", EngineType::modtran },
    { "libradtran", EngineType::libradtran },
    { "6s", EngineType::six_s },
    { "sRTMnet", EngineType::srtmnet },
    { "KernelFlowsGP", EngineType::kernel_flows_gp },
};

auto engineNames() -> std::vector<std::string>
{
    std::vector<std::pair<EngineType, std::string>> pairs {};
    for (const auto& [name, type] : engine_str_to_enum) {
        pairs.emplace_back(type, name);
    }
    std::ranges::sort(pairs);
    std::vector<std::string> names {};
    for (const auto& [type, name] : pairs) {
        names.push_back(name);
    }
    return names;
}

auto engineTypeFromString(const std::string& name) -> EngineType
{
    const auto it { engine_str_to_enum.find(name) };
    if (it == engine_str_to_enum.end()) {
        throw std::invalid_argument {
            "Invalid radiative transfer engine choice. Got: " + name
            + "; Must be one of: " + joinStrings(engineNames(), ", ")
        };
    }
    return it->second;
}

auto engineTypeToString(const EngineType type) -> std::string
{
    const auto it { std::ranges::find_if(
      engine_str_to_enum,
      [type](const auto& item) { return item.second == type; }) };
    return it->first;
}

auto EngineRegistry::bind(const EngineType type,
                          Constructor constructor) -> void
{
    constructors[type] = std::move(constructor);
}

auto EngineRegistry::isBound(const EngineType type) const -> bool
{
    return constructors.contains(type);
}

auto EngineRegistry::create(const EngineParams& params) const
  -> std::unique_ptr<Engine>
{
    const EngineType type { engineTypeFromString(params.engine_name) };
    const auto it { constructors.find(type) };
    if (it == constructors.end()) {
        throw std::runtime_error { "no constructor has been bound for the "
                                   + params.engine_name + " engine" };
    }
    auto engine { it->second(params) };
    if (!engine) {
        throw std::runtime_error { "constructor of the " + params.engine_name
                                   + " engine returned no engine" };
    }
    return engine;
}

} // namespace rtcomp
