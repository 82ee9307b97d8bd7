// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Registry of radiative transfer engine backends. The set of
// supported backends is fixed and each one is identified by its
// configuration name. The constructors are bound at run time by the
// program that links the concrete engines.

#pragma once

#include "engine.h"

#include <functional>
#include <memory>

namespace rtcomp {

enum class EngineType
{
    modtran,
    libradtran,
    six_s,
    srtmnet,
    kernel_flows_gp,
};

// All supported engine names in the order of EngineType
[[nodiscard]] auto engineNames() -> std::vector<std::string>;

// Convert a configuration name such as "sRTMnet" into an EngineType.
// Throws std::invalid_argument listing the valid names.
[[nodiscard]] auto engineTypeFromString(const std::string& name)
  -> EngineType;
[[nodiscard]] auto engineTypeToString(const EngineType type) -> std::string;

class EngineRegistry
{
public:
    using Constructor =
      std::function<std::unique_ptr<Engine>(const EngineParams&)>;

private:
    std::map<EngineType, Constructor> constructors {};

public:
    EngineRegistry() = default;
    // Register the constructor of a backend, replacing any previous one
    auto bind(const EngineType type, Constructor constructor) -> void;
    [[nodiscard]] auto isBound(const EngineType type) const -> bool;
    // Construct an engine. The name must be a supported engine and a
    // constructor must have been bound to it.
    [[nodiscard]] auto create(const EngineParams& params) const
      -> std::unique_ptr<Engine>;
};

} // namespace rtcomp
