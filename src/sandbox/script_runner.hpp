#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/security_validator.hpp"

namespace scriptbox::sandbox {

struct ExecutionRequest {
    std::string script_text;
    std::string language = "python";
    // null when the caller passed no data
    nlohmann::json data;
    std::optional<int> timeout_seconds;
};

// A JSON number read as a timeout request, saturated to the int range.
// Empty for anything that is not a finite number.
std::optional<int> TimeoutFromJson(const nlohmann::json& value);

// Ad-hoc execution: language adapter, security pre-screen, then the
// sandbox executor.
class ScriptRunner {
public:
    explicit ScriptRunner(config::Config config);

    ExecutionResult Run(const ExecutionRequest& request) const;
    ValidationReport Validate(const std::string& script, const std::string& language) const;

    // Per-call timeout: default when absent, clamped to [1, max].
    std::chrono::seconds ResolveTimeout(std::optional<int> requested) const;

    const SandboxExecutor& Executor() const { return executor_; }
    const SecurityValidator& Validator() const { return validator_; }
    const config::Config& Settings() const { return config_; }

private:
    config::Config config_;
    SandboxExecutor executor_;
    SecurityValidator validator_;
};

}  // namespace scriptbox::sandbox
