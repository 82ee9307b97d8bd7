// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Base class of a configuration read from YAML. A derived class
// declares one Setting per parameter (key path, default, and info
// string; optional settings have no default) and lists them in
// scanKeys. The same scanKeys serves reading the configuration and
// dumping it.
//
// class SettingsJacobian : public Settings
// {
// public:
//     struct
//     {
//         Setting<double> eps { { "jacobian", "eps" }, 1e-6, "step" };
//     } jacobian;
//     auto scanKeys() -> void override { scan(jacobian.eps); }
//     auto checkParameters() -> void override {}
// };

#pragma once

#include "yaml.h"

#include <algorithm>
#include <memory>

namespace rtcomp {

class Settings
{
private:
    // Whether scan dumps a setting into the emitter instead of
    // reading it from the configuration
    bool do_dump { false };
    // Warn about keys of the configuration that do not belong to any
    // setting
    auto unrecognizedKeywordCheck() const -> void;
    // Map that the emitter is currently in, as a key path. Settings
    // are scanned in the order of their YAML paths being grouped so
    // only the difference to the previous path needs to be opened or
    // closed.
    std::vector<std::string> cur_map_loc {};
    // Emitter of the current call to c_str and its output
    std::unique_ptr<Emitter> yaml_emitter {};
    std::string dumped {};
    // Close maps of cur_map_loc until only n_keep keys remain
    auto closeMaps(const size_t n_keep) -> void
    {
        while (cur_map_loc.size() > n_keep) {
            *yaml_emitter << YAML::EndMap;
            cur_map_loc.pop_back();
        }
    }
    // Move the emitter into the parent map of a setting and emit it
    template <typename T>
    auto dump(const Setting<T>& setting) -> void
    {
        const std::vector<std::string> parent(setting.yaml_keys.begin(),
                                              setting.yaml_keys.end() - 1);
        const auto [it_cur, it_parent] { std::ranges::mismatch(cur_map_loc,
                                                               parent) };
        closeMaps(static_cast<size_t>(it_cur - cur_map_loc.begin()));
        for (auto it { it_parent }; it != parent.end(); ++it) {
            *yaml_emitter << YAML::Key << *it << YAML::Value << YAML::BeginMap;
            cur_map_loc.push_back(*it);
        }
        *yaml_emitter << setting;
    }

    // Node at a key path or an undefined node if the path does not
    // exist. The tree is not modified.
    [[nodiscard]] static auto findNode(const YAML::Node& root,
                                       const std::vector<std::string>& keys)
      -> YAML::Node;

protected:
    // User configuration
    YAML::Node config {};
    // Every setting at its default value, filled in by init
    YAML::Node default_config {};
    // Every key the scan function comes across. Used for recognizing
    // unknown keys.
    std::vector<std::vector<std::string>> all_valid_keys {};
    // Search for invalid values of configuration parameters and
    // inconsistencies between parameters. Editing parameter values
    // is allowed.
    virtual auto checkParameters() -> void = 0;

public:
    Settings() = default;
    Settings(const std::string& yaml_file)
      : config { YAML::LoadFile(yaml_file) }
    {}
    // Configuration that is already in memory, e.g. embedded in a
    // larger document
    Settings(const YAML::Node& yaml_node) : config { YAML::Clone(yaml_node) }
    {}
    // The emitter state is not copied
    Settings(const Settings& settings)
      : config { YAML::Clone(settings.config) },
        default_config { YAML::Clone(settings.default_config) },
        all_valid_keys { settings.all_valid_keys }
    {}
    // Read all settings from the configuration, warn about unknown
    // keys, and validate. Must be called once after construction.
    auto init() -> void;
    // Call scan on every setting of the derived class
    virtual auto scanKeys() -> void = 0;
    // Read one setting from the configuration, or emit it when
    // dumping
    template <typename T>
    auto scan(Setting<T>& item)
    {
        if (item.yaml_keys.empty()) {
            return;
        }
        if (do_dump) {
            dump(item);
            return;
        }
        all_valid_keys.push_back(item.yaml_keys);
        const YAML::Node node { findNode(config, item.yaml_keys) };
        // If the node is not found leave the default value unmodified
        if (!node) {
            return;
        }
        try {
            item = node.as<T>();
        } catch (const YAML::BadConversion&) {
            // Report the key path and the offending value
            std::string str_value {};
            try {
                str_value = node.as<std::string>();
            } catch (const YAML::BadConversion&) {
                // Non-scalar value, the message is less informative
                str_value = "(not a scalar)";
            }
            throw std::runtime_error { "cannot set " + item.keyToStr()
                                       + ", which is of type " + item.type
                                       + ", to the value " + str_value };
        }
    }
    // All settings with their current values as YAML. In verbose mode
    // each value comes with its type and description which documents
    // the configuration format. The pointer is valid until the next
    // call.
    auto c_str(const bool verbose = true) -> const char*;
    // Configuration as given by the user with the defaults filled in
    // for everything the user did not set
    [[nodiscard]] auto getConfig() const -> std::string;
    virtual ~Settings() = default;
};

} // namespace rtcomp
