#pragma once

#include <filesystem>

#include "registry/module_runner.hpp"
#include "registry/source_loader.hpp"

namespace scriptbox::registry {

// Python module on the local disk; relative locations resolve against
// the registry base directory.
class LocalFileLoader : public SourceLoader {
public:
    LocalFileLoader(const ModuleRunner& runner, std::filesystem::path base_dir);

    SourceType Type() const override { return SourceType::kLocalFile; }
    ScriptOutcome LoadAndRun(const ScriptRegistryEntry& entry,
                             const nlohmann::json& input_data) const override;

    std::filesystem::path Resolve(const std::string& location) const;

private:
    const ModuleRunner& runner_;
    std::filesystem::path base_dir_;
};

}  // namespace scriptbox::registry
