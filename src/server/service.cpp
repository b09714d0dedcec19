#include "server/service.hpp"

#include <utility>

#include "tools/script_tools.hpp"
#include "utils/common.hpp"

namespace scriptbox::server {

Service::Service(config::Config config)
    : config_(std::move(config))
    , runner_(config_)
    , registry_(config_, runner_.Executor())
    , tasks_(runner_, std::string(kServiceType) + "/" + kServiceName) {
    tools::RegisterScriptTools(tools_, runner_);
    if (!config_.registry.catalog_path.empty()) {
        registry_.LoadCatalog(config_.registry.catalog_path);
    }
}

nlohmann::json Service::AvailableExecutables() const {
    const auto resolves = [](const std::string& executable) {
        return !sandbox::SandboxExecutor::ResolveExecutable(executable).empty();
    };
    return {
        {"python", resolves(config_.interpreters.python)},
        {"r", resolves(config_.interpreters.rscript)},
        {"scilab", resolves(config_.interpreters.scilab)},
        {"git", resolves(config_.interpreters.git)}
    };
}

nlohmann::json Service::Health() const {
    const auto tool_names = tools_.List();
    return {
        {"status", "healthy"},
        {"service", std::string(kServiceType) + "/" + kServiceName},
        {"version", kServiceVersion},
        {"sandbox_mode", config_.sandbox.enabled},
        {"max_execution_time", config_.sandbox.max_timeout_s},
        {"available_executables", AvailableExecutables()},
        {"tools_available", tool_names.size()},
        {"available_tools", tool_names},
        {"scripts_loaded", registry_.Size()},
        {"timestamp", utils::FormatIsoTimestamp(utils::Now())}
    };
}

nlohmann::json Service::Info() const {
    return {
        {"name", kServiceName},
        {"type", kServiceType},
        {"version", kServiceVersion},
        {"description", "Sandboxed script execution and analysis script registry"},
        {"capabilities", {"python_execution", "r_execution", "scilab_execution",
                          "mathematical_modeling", "numerical_analysis", "optimization",
                          "simulation", "script_registry"}},
        {"available_tools", tools_.List()},
        {"security", {
            {"sandbox_mode", config_.sandbox.enabled},
            {"max_execution_time", config_.sandbox.max_timeout_s},
            {"memory_limit_mb", config_.sandbox.memory_limit_mb},
            {"isolate_network", config_.sandbox.isolate_network}
        }},
        {"endpoints", {"/health", "/info", "/tools", "/tools/<name>", "/validate_script",
                       "/process_task", "/scripts", "/scripts/<id>", "/scripts/<id>/schema",
                       "/execute", "/validate", "/statistics", "/categories", "/source-types",
                       "/reload"}}
    };
}

}  // namespace scriptbox::server
