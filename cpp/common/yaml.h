// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Extensions of the YAML library that are necessary to work with
// non-standard types of this project.

#pragma once

#include "setting.h"

#include <type_traits>
#include <yaml-cpp/yaml.h>

// Instruct YAML how to read values into non-standard types, e.g., how
// to read into a parameter of type std::optional.
namespace YAML {

template <typename T>
struct convert<std::optional<T>>
{
    static auto decode(const Node& node, std::optional<T>& rhs) -> bool
    {
        // Null values are okay. Then the optional parameter remains unset.
        if (!node.IsNull()) {
            rhs.emplace(node.as<T>());
        }
        return true;
    }
};

} // namespace YAML

namespace rtcomp {

// Instruct YAML how to print the value field of a parameter of type
// std::optional.
template <typename T>
auto operator<<(YAML::Emitter& out,
                const std::optional<T> value) -> YAML::Emitter&
{
    if (value) {
        out << value.value();
    } else {
        out << YAML::Null;
    }
    return out;
}

// Emitter that knows whether to document each setting or print
// only its value
class Emitter : public YAML::Emitter
{
public:
    bool verbose {};
};

// Emit a setting as a key-value pair. Lists of numbers are kept on
// one line. In verbose mode the value is replaced by a map of the
// value, its type, and the description of the setting.
template <typename T>
static auto operator<<(Emitter& out, const Setting<T>& setting) -> Emitter&
{
    // NOLINTNEXTLINE(cppcoreguidelines-slicing)
    const T& value { setting };
    out << YAML::Key << setting.yaml_keys.back() << YAML::Value;
    if (out.verbose) {
        out << YAML::BeginMap << YAML::Key << "default" << YAML::Value;
    }
    if constexpr (std::is_same_v<T, std::vector<double>>) {
        out << YAML::Flow;
    }
    out << value;
    if (out.verbose) {
        out << YAML::Key << "type" << YAML::Value << setting.type
            << YAML::Key << "info" << YAML::Value << YAML::Literal
            << setting.info << YAML::EndMap;
    }
    return out;
}

} // namespace rtcomp
