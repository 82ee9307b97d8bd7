// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings.h"

#include <ranges>
#include <spdlog/spdlog.h>
#include <utility>

namespace rtcomp {

auto Settings::init() -> void
{
    default_config = YAML::Load(c_str(false));
    scanKeys();
    unrecognizedKeywordCheck();
    checkParameters();
}

auto Settings::findNode(const YAML::Node& root,
                        const std::vector<std::string>& keys) -> YAML::Node
{
    // Assigning to a YAML::Node rebinds the node it refers to within
    // the tree. Each level is therefore held in a new node.
    std::vector<YAML::Node> levels { root };
    for (const auto& key : keys) {
        levels.push_back(std::as_const(levels.back())[key]);
        if (!levels.back()) {
            break;
        }
    }
    return levels.back();
}

// Key paths of all leaves of a YAML tree. Anything that is not a map
// is a leaf, including lists.
// NOLINTNEXTLINE(misc-no-recursion)
static auto leafKeyPaths(const YAML::Node& node,
                         std::vector<std::string>& path,
                         std::vector<std::vector<std::string>>& paths) -> void
{
    if (!node.IsMap()) {
        if (!path.empty()) {
            paths.push_back(path);
        }
        return;
    }
    for (const auto& item : node) {
        path.push_back(item.first.as<std::string>());
        leafKeyPaths(item.second, path, paths);
        path.pop_back();
    }
}

auto Settings::unrecognizedKeywordCheck() const -> void
{
    std::vector<std::vector<std::string>> paths {};
    std::vector<std::string> path {};
    leafKeyPaths(config, path, paths);
    // A leaf is recognized if a setting is at the leaf or above it
    // (the entries of a map-valued setting such as a LUT grid).
    const auto is_recognized { [this](const std::vector<std::string>& leaf) {
        return std::ranges::any_of(all_valid_keys, [&leaf](const auto& keys) {
            return keys.size() <= leaf.size()
                   && std::ranges::equal(keys, leaf | std::views::take(keys.size()));
        });
    } };
    for (const auto& leaf : paths) {
        if (!is_recognized(leaf)) {
            spdlog::warn("unrecognized input parameter: {}",
                         Setting<bool> { leaf, false, "" }.keyToStr());
        }
    }
}

auto Settings::c_str(const bool verbose) -> const char*
{
    yaml_emitter = std::make_unique<Emitter>();
    yaml_emitter->SetBoolFormat(YAML::TrueFalseBool);
    yaml_emitter->SetNullFormat(YAML::LowerNull);
    yaml_emitter->verbose = verbose;
    cur_map_loc.clear();
    *yaml_emitter << YAML::BeginMap;
    do_dump = true;
    scanKeys();
    do_dump = false;
    closeMaps(0);
    *yaml_emitter << YAML::EndMap;
    dumped = yaml_emitter->c_str();
    yaml_emitter.reset();
    return dumped.c_str();
}

// Reference tree with the values of the input tree where the input
// has them. Keys only found in the input are kept.
// NOLINTNEXTLINE(misc-no-recursion)
static auto overlay(const YAML::Node& reference,
                    const YAML::Node& input) -> YAML::Node
{
    if (!reference.IsMap() || !input.IsMap()) {
        return YAML::Clone(input);
    }
    YAML::Node merged { YAML::Clone(reference) };
    for (const auto& item : input) {
        const std::string key { item.first.as<std::string>() };
        const YAML::Node ref_child { reference[key] };
        merged[key] = ref_child ? overlay(ref_child, item.second)
                                : YAML::Clone(item.second);
    }
    return merged;
}

auto Settings::getConfig() const -> std::string
{
    YAML::Emitter out {};
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetNullFormat(YAML::LowerNull);
    out << overlay(default_config, config);
    return out.c_str();
}

} // namespace rtcomp
