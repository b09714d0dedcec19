#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "registry/script_registry.hpp"
#include "sandbox/script_runner.hpp"
#include "tasks/task_processor.hpp"
#include "tools/tool_registry.hpp"

namespace scriptbox::server {

constexpr const char* kServiceName = "script-execution";
constexpr const char* kServiceType = "scriptbox";
constexpr const char* kServiceVersion = "1.0.0";

// Everything one running instance owns. Not copyable: the registry and
// tools hold references into the runner.
class Service {
public:
    explicit Service(config::Config config);
    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    const config::Config& Settings() const { return config_; }
    const sandbox::ScriptRunner& Runner() const { return runner_; }
    registry::ScriptRegistry& Registry() { return registry_; }
    const registry::ScriptRegistry& Registry() const { return registry_; }
    const tools::ToolRegistry& Tools() const { return tools_; }
    const tasks::TaskProcessor& Tasks() const { return tasks_; }

    // {python, r, scilab, git} -> resolves on PATH
    nlohmann::json AvailableExecutables() const;
    nlohmann::json Health() const;
    nlohmann::json Info() const;

private:
    config::Config config_;
    sandbox::ScriptRunner runner_;
    registry::ScriptRegistry registry_;
    tools::ToolRegistry tools_;
    tasks::TaskProcessor tasks_;
};

}  // namespace scriptbox::server
