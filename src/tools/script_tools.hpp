#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/language_adapter.hpp"
#include "sandbox/script_runner.hpp"
#include "tools/tool.hpp"
#include "tools/tool_registry.hpp"

namespace scriptbox::tools {

// execute_<language>_script
class ExecuteScriptTool : public Tool {
public:
    ExecuteScriptTool(const sandbox::ScriptRunner& runner, sandbox::Language language);

    std::string Name() const override;
    std::string Description() const override;
    nlohmann::json ParametersSchema() const override;
    nlohmann::json Execute(const nlohmann::json& arguments) override;

private:
    const sandbox::ScriptRunner& runner_;
    sandbox::Language language_;
};

// Wraps a caller-defined objective `f` in a scipy.optimize.minimize driver.
class OptimizeFunctionTool : public Tool {
public:
    explicit OptimizeFunctionTool(const sandbox::ScriptRunner& runner);

    std::string Name() const override { return "optimize_function"; }
    std::string Description() const override {
        return "Optimize a mathematical function using scipy.optimize";
    }
    nlohmann::json ParametersSchema() const override;
    nlohmann::json Execute(const nlohmann::json& arguments) override;

    static bool IsSupportedMethod(const std::string& method);
    static std::string BuildProgram(const std::string& objective_function,
                                    const std::vector<std::string>& constraints);

private:
    const sandbox::ScriptRunner& runner_;
};

// Monte Carlo driver around a caller-defined simulate_once(parameters).
class RunSimulationTool : public Tool {
public:
    static constexpr int kDefaultIterations = 1000;
    static constexpr int kMaxIterations = 1000000;

    explicit RunSimulationTool(const sandbox::ScriptRunner& runner);

    std::string Name() const override { return "run_simulation"; }
    std::string Description() const override { return "Run a Monte Carlo simulation"; }
    nlohmann::json ParametersSchema() const override;
    nlohmann::json Execute(const nlohmann::json& arguments) override;

    static std::string BuildProgram(const std::string& simulation_script);

private:
    const sandbox::ScriptRunner& runner_;
};

// Registers the five execution tools backed by `runner`.
void RegisterScriptTools(ToolRegistry& registry, const sandbox::ScriptRunner& runner);

}  // namespace scriptbox::tools
