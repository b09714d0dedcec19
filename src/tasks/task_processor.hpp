#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/script_runner.hpp"

namespace scriptbox::tasks {

struct TaskResponse {
    int http_status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// Orchestrator-facing entry point: runs a workflow task's script, or
// synthesizes one from the task context when none is supplied.
class TaskProcessor {
public:
    static constexpr std::size_t kMinScriptLength = 10;

    TaskProcessor(const sandbox::ScriptRunner& runner, std::string service_name);

    TaskResponse Process(const nlohmann::json& request) const;

private:
    const sandbox::ScriptRunner& runner_;
    std::string service_name_;
};

}  // namespace scriptbox::tasks
