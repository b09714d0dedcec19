#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "registry/input_validator.hpp"
#include "registry/module_runner.hpp"
#include "registry/registry_types.hpp"
#include "registry/source_loader.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace scriptbox::registry {

using Catalog = std::map<std::string, ScriptRegistryEntry>;

// Catalog of named analysis scripts and the single dispatch point for
// running them. The catalog is replaced wholesale on (re)load, so readers
// never need a lock.
class ScriptRegistry {
public:
    ScriptRegistry(const config::Config& config, const sandbox::SandboxExecutor& executor);
    ScriptRegistry(const ScriptRegistry&) = delete;
    ScriptRegistry& operator=(const ScriptRegistry&) = delete;

    // Call before serving. A missing or malformed file leaves an empty
    // catalog and returns false.
    bool LoadCatalog(const std::filesystem::path& path);
    void LoadFromJson(const nlohmann::json& catalog);
    bool Reload();

    std::vector<ScriptRegistryEntry> List(const std::string& category = {},
                                          const std::string& source_type = {}) const;
    std::optional<ScriptRegistryEntry> Get(const std::string& id) const;
    nlohmann::json GetSchema(const std::string& id) const;
    InputValidation ValidateInput(const std::string& id, const nlohmann::json& input_data) const;
    nlohmann::json Statistics() const;
    std::size_t Size() const;

    ScriptOutcome Execute(const std::string& id, const nlohmann::json& input_data) const;

    const std::filesystem::path& CatalogPath() const { return catalog_path_; }

private:
    std::shared_ptr<const Catalog> Snapshot() const;
    bool ReadCatalogFile(const std::filesystem::path& path);
    void RegisterLoader(std::unique_ptr<SourceLoader> loader);

    std::filesystem::path catalog_path_;
    ModuleRunner module_runner_;
    std::unordered_map<SourceType, std::unique_ptr<SourceLoader>> loaders_;
    std::shared_ptr<const Catalog> catalog_;
};

}  // namespace scriptbox::registry
