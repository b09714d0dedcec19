#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "registry/registry_types.hpp"
#include "sandbox/language_adapter.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace scriptbox::registry {

// Runs a Python module exposing execute(input_data) inside the sandbox.
// A generated driver imports the module, calls execute and prints the
// JSON result on a marked stdout line.
class ModuleRunner {
public:
    static constexpr const char* kResultMarker = "__SCRIPTBOX_RESULT__";
    static constexpr const char* kErrorMarker = "__SCRIPTBOX_ERROR__";

    ModuleRunner(const sandbox::SandboxExecutor& executor,
                 std::string python_executable,
                 bool sandbox_enabled,
                 int max_timeout_s);

    ScriptOutcome RunFile(const std::filesystem::path& module_path,
                          const ScriptRegistryEntry& entry,
                          const nlohmann::json& input_data) const;
    ScriptOutcome RunSource(const std::string& source,
                            const ScriptRegistryEntry& entry,
                            const nlohmann::json& input_data) const;

    static std::string BuildFileDriver(const std::filesystem::path& module_path,
                                       const nlohmann::json& input_data);
    static std::string BuildSourceDriver(const std::string& source,
                                         const std::string& origin,
                                         const nlohmann::json& input_data);

private:
    ScriptOutcome Run(const std::string& driver,
                      const ScriptRegistryEntry& entry) const;

    const sandbox::SandboxExecutor& executor_;
    sandbox::PythonAdapter adapter_;
    bool sandbox_enabled_;
    int max_timeout_s_;
};

}  // namespace scriptbox::registry
