// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A configuration parameter with its location in the YAML tree, a
// default value, and a description. The key path
//
//   jacobian:
//     eps: 1e-6
//
// is { "jacobian", "eps" }. Primitive values live in the value member
// and the setting converts to its value implicitly:
//
//   const double step { settings.jacobian.eps };
//
// Strings, lists, maps, and optionals derive from the container type
// instead, so for instance statevector.size() works directly. Records
// such as state vector elements or engine configurations are stored
// the same way as primitives.

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace rtcomp {

// Structured configuration entries declare their YAML type name
// through a static yaml_type member.
template <typename T>
concept YAMLRecord = requires { T::yaml_type; };

template <typename>
inline constexpr bool unsupported_setting_type { false };

// Name of a value type as shown in the documented configuration
template <typename T>
[[nodiscard]] auto settingTypeName() -> std::string
{
    if constexpr (std::is_same_v<T, bool>) {
        return "boolean";
    } else if constexpr (std::is_same_v<T, int>) {
        return "integer";
    } else if constexpr (std::is_same_v<T, size_t>) {
        return "unsigned integer";
    } else if constexpr (std::is_same_v<T, double>) {
        return "double (float64)";
    } else if constexpr (std::is_same_v<T, std::string> || std::is_enum_v<T>) {
        return "string";
    } else if constexpr (YAMLRecord<T>) {
        return std::string { T::yaml_type };
    } else {
        static_assert(unsupported_setting_type<T>,
                      "add a type name for this type to settingTypeName");
    }
}

// Key path, description, and type name of a setting. The value is
// held by the derived class.
template <typename T>
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    const std::string info {};
    std::string type {};

    // Unused setting
    SettingBase() = default;
    // container is appended to the type name, e.g. "double (float64)
    // list"
    SettingBase(const std::string& container,
                const std::vector<std::string>& yaml_keys,
                const std::string& info)
      : yaml_keys { yaml_keys },
        info { info },
        type { container.empty() ? settingTypeName<T>()
                                 : settingTypeName<T>() + ' ' + container }
    {}
    // Key path for messages, e.g. [jacobian][eps]
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::string path {};
        for (const auto& key : yaml_keys) {
            path += '[' + key + ']';
        }
        return path;
    }
    ~SettingBase() = default;
};

// Setting class for primitive types
template <typename T>
class Setting : public SettingBase<T>
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase<T> { "", yaml_keys, info }, value { value }
    {}

    // Read and assign like a T
    operator T() const { return value; }
    auto operator=(const T& value) -> Setting<T>&
    {
        this->value = value;
        return *this;
    }

    ~Setting() = default;
};

// Setting class for storing a list of values
template <typename T>
class Setting<std::vector<T>>
  : public SettingBase<T>
  , public std::vector<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T> value,
            const std::string& info)
      : SettingBase<T> { "list", yaml_keys, info }, std::vector<T> { value }
    {}
    // Make the assignment act on the std::vector base of the instance
    auto operator=(const std::vector<T>& value) -> Setting<std::vector<T>>&
    {
        std::vector<T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting class for a map from names to values, e.g. the LUT grid
// { H2OSTR: [0.5, 1.0, 1.5], AOT550: [0.01, 0.1] }
template <typename T>
class Setting<std::map<std::string, T>>
  : public SettingBase<double>
  , public std::map<std::string, T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::map<std::string, T> value,
            const std::string& info)
      : SettingBase<double> { "lists by name", yaml_keys, info }
      , std::map<std::string, T> { value }
    {}
    auto operator=(const std::map<std::string, T>& value)
      -> Setting<std::map<std::string, T>>&
    {
        std::map<std::string, T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting class for std::optional<T>. Optional means that no
// reasonable default value exists. For the engine options it also
// means that a lower priority configuration layer may provide the
// value instead.
//
// The base class is called with just T which means that the string
// representation of type is still that of T.
template <typename T>
class Setting<std::optional<T>>
  : public SettingBase<T>
  , public std::optional<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys, const std::string& info)
      : SettingBase<T> { "", yaml_keys, info }, std::optional<T> {}
    {}
    auto operator=(const std::optional<T>& value) -> Setting<std::optional<T>>&
    {
        std::optional<T>* base { this };
        *base = value;
        return *this;
    }
};

// Define a setting class for strings
template <>
class Setting<std::string>
  : public SettingBase<std::string>
  , public std::string
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string value,
            const std::string& info)
      : SettingBase<std::string> { "", yaml_keys, info }, std::string { value }
    {}
    auto operator=(const std::string& value) -> Setting<std::string>&
    {
        std::string* base { this };
        *base = value;
        return *this;
    }
};

} // namespace rtcomp
