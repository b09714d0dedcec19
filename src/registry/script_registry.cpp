#include "registry/script_registry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <utility>

#include "registry/loaders/git_repository_loader.hpp"
#include "registry/loaders/inline_source_loader.hpp"
#include "registry/loaders/local_file_loader.hpp"
#include "registry/loaders/remote_server_loader.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::registry {

ScriptRegistry::ScriptRegistry(const config::Config& config, const sandbox::SandboxExecutor& executor)
    : catalog_path_(config.registry.catalog_path)
    , module_runner_(executor,
                     config.interpreters.python,
                     config.sandbox.enabled,
                     config.sandbox.max_timeout_s)
    , catalog_(std::make_shared<const Catalog>()) {
    std::filesystem::path base_dir = config.registry.base_dir;
    if (base_dir.empty() && !catalog_path_.empty()) {
        base_dir = catalog_path_.parent_path();
    }
    RegisterLoader(std::make_unique<InlineSourceLoader>(module_runner_));
    RegisterLoader(std::make_unique<LocalFileLoader>(module_runner_, base_dir));
    RegisterLoader(std::make_unique<RemoteServerLoader>(config.registry.remote_timeout_s));
    RegisterLoader(std::make_unique<GitRepositoryLoader>(
        module_runner_,
        config.interpreters.git,
        executor.Options().temp_root,
        std::chrono::seconds(std::max(1, config.registry.remote_timeout_s))));
}

void ScriptRegistry::RegisterLoader(std::unique_ptr<SourceLoader> loader) {
    const auto type = loader->Type();
    loaders_[type] = std::move(loader);
}

std::shared_ptr<const Catalog> ScriptRegistry::Snapshot() const {
    return std::atomic_load(&catalog_);
}

bool ScriptRegistry::LoadCatalog(const std::filesystem::path& path) {
    catalog_path_ = path;
    return ReadCatalogFile(path);
}

bool ScriptRegistry::ReadCatalogFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utils::Log(utils::LogLevel::kWarn, "registry", "catalog not found, starting empty",
                   {{"path", path.string()}});
        LoadFromJson(nlohmann::json::object());
        return false;
    }
    auto data = nlohmann::json::parse(file, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        utils::Log(utils::LogLevel::kError, "registry", "catalog is not a JSON object",
                   {{"path", path.string()}});
        LoadFromJson(nlohmann::json::object());
        return false;
    }
    LoadFromJson(data);
    return true;
}

void ScriptRegistry::LoadFromJson(const nlohmann::json& catalog) {
    auto entries = std::make_shared<Catalog>();
    if (catalog.is_object()) {
        for (const auto& item : catalog.items()) {
            if (!item.value().is_object()) {
                utils::Log(utils::LogLevel::kWarn, "registry", "skipping malformed entry",
                           {{"script_id", item.key()}});
                continue;
            }
            auto entry = EntryFromJson(item.key(), item.value());
            entries->emplace(item.key(), std::move(entry));
        }
    }
    utils::Log(utils::LogLevel::kInfo, "registry", "catalog loaded",
               {{"scripts", std::to_string(entries->size())}});
    std::atomic_store(&catalog_, std::shared_ptr<const Catalog>(std::move(entries)));
}

bool ScriptRegistry::Reload() {
    if (catalog_path_.empty()) {
        return false;
    }
    return ReadCatalogFile(catalog_path_);
}

std::vector<ScriptRegistryEntry> ScriptRegistry::List(const std::string& category,
                                                      const std::string& source_type) const {
    const auto catalog = Snapshot();
    std::vector<ScriptRegistryEntry> entries;
    for (const auto& item : *catalog) {
        const auto& entry = item.second;
        if (!category.empty() && entry.category != category) {
            continue;
        }
        if (!source_type.empty()) {
            const auto wanted = ParseSourceType(source_type);
            if (wanted ? entry.source_type != wanted : entry.source_type_name != source_type) {
                continue;
            }
        }
        entries.push_back(entry);
    }
    return entries;
}

std::optional<ScriptRegistryEntry> ScriptRegistry::Get(const std::string& id) const {
    const auto catalog = Snapshot();
    const auto it = catalog->find(id);
    if (it == catalog->end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json ScriptRegistry::GetSchema(const std::string& id) const {
    const auto entry = Get(id);
    if (!entry) {
        return {{"error", "Script " + id + " not found"}};
    }
    return {
        {"script_id", id},
        {"input_schema", entry->input_schema},
        {"output_schema", entry->output_schema},
        {"llm_template_instructions", entry->llm_template_instructions}
    };
}

InputValidation ScriptRegistry::ValidateInput(const std::string& id, const nlohmann::json& input_data) const {
    const auto entry = Get(id);
    if (!entry) {
        InputValidation validation{};
        validation.valid = false;
        validation.errors.push_back("Script " + id + " not found");
        return validation;
    }
    return registry::ValidateInput(entry->input_schema, input_data);
}

nlohmann::json ScriptRegistry::Statistics() const {
    const auto catalog = Snapshot();
    nlohmann::json categories = nlohmann::json::object();
    nlohmann::json source_types = nlohmann::json::object();
    nlohmann::json execution_types = nlohmann::json::object();
    for (const auto& item : *catalog) {
        const auto& entry = item.second;
        categories[entry.category] = categories.value(entry.category, 0) + 1;
        source_types[entry.source_type_name] = source_types.value(entry.source_type_name, 0) + 1;
        execution_types[entry.execution_type] = execution_types.value(entry.execution_type, 0) + 1;
    }
    return {
        {"total_scripts", catalog->size()},
        {"categories", categories},
        {"source_types", source_types},
        {"execution_types", execution_types},
        {"registry_file", catalog_path_.string()},
        {"last_loaded", utils::FormatIsoTimestamp(utils::Now())}
    };
}

std::size_t ScriptRegistry::Size() const {
    return Snapshot()->size();
}

ScriptOutcome ScriptRegistry::Execute(const std::string& id, const nlohmann::json& input_data) const {
    const auto started = std::chrono::steady_clock::now();
    const auto entry = Get(id);
    if (!entry) {
        utils::Log(utils::LogLevel::kWarn, "registry", "unknown script", {{"script_id", id}});
        return MakeErrorOutcome(sandbox::ErrorKind::kValidation, "Script " + id + " not found", id);
    }

    const auto validation = registry::ValidateInput(entry->input_schema, input_data);
    if (!validation.valid) {
        auto outcome = MakeErrorOutcome(sandbox::ErrorKind::kValidation, "Input validation failed", id);
        outcome.validation_errors = validation.errors;
        return outcome;
    }

    const auto loader = entry->source_type ? loaders_.find(*entry->source_type) : loaders_.end();
    if (loader == loaders_.end()) {
        return MakeErrorOutcome(sandbox::ErrorKind::kValidation,
                                "Unsupported source type: " + entry->source_type_name, id);
    }

    utils::Log(utils::LogLevel::kInfo, "registry", "execute",
               {{"script_id", id}, {"source_type", entry->source_type_name}});
    ScriptOutcome outcome{};
    try {
        outcome = loader->second->LoadAndRun(*entry, input_data);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "registry", "execution failed",
                   {{"script_id", id}, {"error", ex.what()}});
        outcome = MakeErrorOutcome(sandbox::ErrorKind::kInternal,
                                   std::string("Execution failed: ") + ex.what(), id);
    }

    outcome.script_id = id;
    outcome.execution_metadata["source_type"] = entry->source_type_name;
    outcome.execution_metadata["timestamp"] = utils::FormatIsoTimestamp(utils::Now());
    outcome.execution_metadata["duration"] =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    utils::Log(outcome.success ? utils::LogLevel::kInfo : utils::LogLevel::kWarn, "registry", "finished",
               {{"script_id", id},
                {"status", outcome.success ? "success" : "error"},
                {"error_type", sandbox::ToString(outcome.error_kind)}});
    return outcome;
}

}  // namespace scriptbox::registry
