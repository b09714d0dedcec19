#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "registry/module_runner.hpp"
#include "registry/source_loader.hpp"

namespace scriptbox::registry {

// Shallow-clones the repository into a fresh Workspace, then runs
// `source_path` from the clone like a local file. The clone never
// outlives the call.
class GitRepositoryLoader : public SourceLoader {
public:
    GitRepositoryLoader(const ModuleRunner& runner,
                        std::string git_executable,
                        std::filesystem::path temp_root,
                        std::chrono::seconds clone_timeout);

    SourceType Type() const override { return SourceType::kGitRepository; }
    ScriptOutcome LoadAndRun(const ScriptRegistryEntry& entry,
                             const nlohmann::json& input_data) const override;

private:
    // Empty on success, otherwise the diagnostic text of the failed clone.
    std::string Clone(const std::string& repository,
                      const std::filesystem::path& target,
                      const std::filesystem::path& log_path) const;

    const ModuleRunner& runner_;
    std::string git_executable_;
    std::filesystem::path temp_root_;
    std::chrono::seconds clone_timeout_;
};

}  // namespace scriptbox::registry
