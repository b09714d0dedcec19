#pragma once

#include "nlohmann/json.hpp"
#include "registry/registry_types.hpp"

namespace scriptbox::registry {

// One strategy per source_type. Implementations report every failure in
// the returned outcome.
class SourceLoader {
public:
    virtual ~SourceLoader() = default;
    virtual SourceType Type() const = 0;
    virtual ScriptOutcome LoadAndRun(const ScriptRegistryEntry& entry,
                                     const nlohmann::json& input_data) const = 0;
};

}  // namespace scriptbox::registry
