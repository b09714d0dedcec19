#pragma once

#include "registry/module_runner.hpp"
#include "registry/source_loader.hpp"

namespace scriptbox::registry {

// Code stored in the catalog entry itself.
class InlineSourceLoader : public SourceLoader {
public:
    explicit InlineSourceLoader(const ModuleRunner& runner);

    SourceType Type() const override { return SourceType::kInline; }
    ScriptOutcome LoadAndRun(const ScriptRegistryEntry& entry,
                             const nlohmann::json& input_data) const override;

private:
    const ModuleRunner& runner_;
};

}  // namespace scriptbox::registry
