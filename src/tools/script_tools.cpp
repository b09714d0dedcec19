#include "tools/script_tools.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::tools {
namespace {

const char* kSupportedMethods[] = {"BFGS", "L-BFGS-B", "SLSQP", "trust-constr"};

nlohmann::json ValidationError(const std::string& message, const std::string& language = "python") {
    return {
        {"success", false},
        {"error", message},
        {"error_type", sandbox::ToString(sandbox::ErrorKind::kValidation)},
        {"language", language}
    };
}

// Embedded caller text has to pass the same screen as a submitted script.
std::optional<nlohmann::json> ScreenFragment(const sandbox::ScriptRunner& runner,
                                             const std::string& fragment,
                                             const std::string& label) {
    const auto report = runner.Validate(fragment, "python");
    if (report.valid) {
        return std::nullopt;
    }
    utils::Log(utils::LogLevel::kWarn, "security", "embedded fragment rejected", {{"fragment", label}});
    return nlohmann::json{
        {"success", false},
        {"error", label + " failed security validation: " + utils::Join(report.Warnings(), "; ")},
        {"error_type", sandbox::ToString(sandbox::ErrorKind::kSecurityViolation)},
        {"findings", report.ToJson()["findings"]},
        {"language", "python"}
    };
}

std::optional<int> OptionalTimeout(const nlohmann::json& arguments) {
    if (!arguments.contains("timeout")) {
        return std::nullopt;
    }
    return sandbox::TimeoutFromJson(arguments["timeout"]);
}

// The wrappers print one JSON document; surface it as `result`.
nlohmann::json RunWrapped(const sandbox::ScriptRunner& runner, sandbox::ExecutionRequest request) {
    const auto execution = runner.Run(request);
    auto json = sandbox::ToJson(execution);
    if (execution.success) {
        auto parsed = nlohmann::json::parse(execution.stdout_text, nullptr, false);
        if (!parsed.is_discarded()) {
            json["result"] = std::move(parsed);
        }
    }
    return json;
}

}  // namespace

ExecuteScriptTool::ExecuteScriptTool(const sandbox::ScriptRunner& runner, sandbox::Language language)
    : runner_(runner)
    , language_(language) {}

std::string ExecuteScriptTool::Name() const {
    return "execute_" + utils::ToLower(sandbox::ToString(language_)) + "_script";
}

std::string ExecuteScriptTool::Description() const {
    switch (language_) {
        case sandbox::Language::kPython:
            return "Execute a Python script for mathematical computations";
        case sandbox::Language::kR:
            return "Execute an R script for statistical analysis";
        case sandbox::Language::kScilab:
            return "Execute a Scilab script for numerical computations";
    }
    return "Execute a script";
}

nlohmann::json ExecuteScriptTool::ParametersSchema() const {
    const std::string label = language_ == sandbox::Language::kPython ? "Python"
                              : language_ == sandbox::Language::kR    ? "R"
                                                                      : "Scilab";
    const std::string data_description = language_ == sandbox::Language::kPython
                                             ? "Optional data to pass to the script as 'script_data' variable"
                                             : "Optional data to pass to the script as variables";
    return {
        {"type", "object"},
        {"properties", {
            {"script", {{"type", "string"}, {"description", label + " script code to execute"}}},
            {"data", {{"type", "object"}, {"description", data_description}}},
            {"timeout", {{"type", "integer"},
                         {"description", "Execution timeout in seconds"},
                         {"default", runner_.Settings().sandbox.default_timeout_s}}}
        }},
        {"required", {"script"}}
    };
}

nlohmann::json ExecuteScriptTool::Execute(const nlohmann::json& arguments) {
    sandbox::ExecutionRequest request{};
    request.script_text = arguments.at("script").get<std::string>();
    request.language = sandbox::ToString(language_);
    if (arguments.contains("data") && !arguments["data"].is_null()) {
        request.data = arguments["data"];
    }
    request.timeout_seconds = OptionalTimeout(arguments);
    return sandbox::ToJson(runner_.Run(request));
}

OptimizeFunctionTool::OptimizeFunctionTool(const sandbox::ScriptRunner& runner)
    : runner_(runner) {}

bool OptimizeFunctionTool::IsSupportedMethod(const std::string& method) {
    for (const auto* supported : kSupportedMethods) {
        if (method == supported) {
            return true;
        }
    }
    return false;
}

nlohmann::json OptimizeFunctionTool::ParametersSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"objective_function", {
                {"type", "string"},
                {"description", "Python function definition to optimize (e.g., 'def f(x): return x[0]**2 + 5*x[0] + 6')"}}},
            {"initial_guess", {
                {"type", "array"},
                {"items", {{"type", "number"}}},
                {"description", "Initial guess for optimization variables"}}},
            {"constraints", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "Inequality constraints as Python expressions in x, each required to be >= 0"},
                {"default", nlohmann::json::array()}}},
            {"method", {
                {"type", "string"},
                {"enum", {"BFGS", "L-BFGS-B", "SLSQP", "trust-constr"}},
                {"description", "Optimization method"},
                {"default", "BFGS"}}},
            {"timeout", {{"type", "integer"}, {"description", "Execution timeout in seconds"}}}
        }},
        {"required", {"objective_function", "initial_guess"}}
    };
}

std::string OptimizeFunctionTool::BuildProgram(const std::string& objective_function,
                                               const std::vector<std::string>& constraints) {
    std::ostringstream oss;
    oss << "import json\n"
        << "import numpy as np\n"
        << "from scipy import optimize\n\n"
        << objective_function << "\n\n"
        << "initial_guess = script_data['initial_guess']\n"
        << "method = script_data['method']\n"
        << "constraints = [\n";
    for (const auto& constraint : constraints) {
        oss << "    {'type': 'ineq', 'fun': lambda x: (" << constraint << ")},\n";
    }
    oss << "]\n\n"
        << "try:\n"
        << "    if constraints:\n"
        << "        result = optimize.minimize(f, initial_guess, method=method, constraints=constraints)\n"
        << "    else:\n"
        << "        result = optimize.minimize(f, initial_guess, method=method)\n"
        << "    optimization_result = {\n"
        << "        'success': bool(result.success),\n"
        << "        'optimal_value': float(result.fun),\n"
        << "        'optimal_point': np.atleast_1d(result.x).tolist(),\n"
        << "        'iterations': int(result.nit) if hasattr(result, 'nit') else None,\n"
        << "        'message': str(result.message),\n"
        << "        'method_used': method,\n"
        << "    }\n"
        << "except Exception as e:\n"
        << "    optimization_result = {'success': False, 'error': str(e), 'method_used': method}\n\n"
        << "print(json.dumps(optimization_result, indent=2))\n";
    return oss.str();
}

nlohmann::json OptimizeFunctionTool::Execute(const nlohmann::json& arguments) {
    const auto objective = arguments.at("objective_function").get<std::string>();
    const auto& initial_guess = arguments.at("initial_guess");
    const auto method = arguments.value("method", std::string("BFGS"));
    std::vector<std::string> constraints;
    if (arguments.contains("constraints") && arguments["constraints"].is_array()) {
        constraints = arguments["constraints"].get<std::vector<std::string>>();
    }

    if (!IsSupportedMethod(method)) {
        return ValidationError("Unsupported optimization method: " + method);
    }
    if (initial_guess.empty()) {
        return ValidationError("initial_guess must not be empty");
    }
    for (const auto& value : initial_guess) {
        if (!value.is_number()) {
            return ValidationError("initial_guess must contain only numbers");
        }
    }
    static const std::regex kDefinesF(R"((^|\n)\s*(def\s+f\s*\(|f\s*=))");
    if (!std::regex_search(objective, kDefinesF)) {
        return ValidationError("objective_function must define a function named 'f'");
    }
    if (auto rejected = ScreenFragment(runner_, objective, "objective_function")) {
        return *rejected;
    }
    for (const auto& constraint : constraints) {
        if (constraint.find('\n') != std::string::npos) {
            return ValidationError("constraints must be single-line expressions");
        }
        if (auto rejected = ScreenFragment(runner_, constraint, "constraint")) {
            return *rejected;
        }
    }

    sandbox::ExecutionRequest request{};
    request.script_text = BuildProgram(objective, constraints);
    request.language = "python";
    request.data = {{"initial_guess", initial_guess}, {"method", method}};
    request.timeout_seconds = OptionalTimeout(arguments);
    return RunWrapped(runner_, request);
}

RunSimulationTool::RunSimulationTool(const sandbox::ScriptRunner& runner)
    : runner_(runner) {}

nlohmann::json RunSimulationTool::ParametersSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"simulation_script", {
                {"type", "string"},
                {"description", "Python code defining simulate_once(parameters), returning one numeric sample"}}},
            {"iterations", {
                {"type", "integer"},
                {"description", "Number of simulation iterations"},
                {"default", kDefaultIterations}}},
            {"parameters", {{"type", "object"}, {"description", "Simulation parameters"}}},
            {"timeout", {{"type", "integer"}, {"description", "Execution timeout in seconds"}}}
        }},
        {"required", {"simulation_script"}}
    };
}

std::string RunSimulationTool::BuildProgram(const std::string& simulation_script) {
    std::ostringstream oss;
    oss << "import json\n"
        << "import sys\n"
        << "import numpy as np\n\n"
        << simulation_script << "\n\n"
        << "iterations = int(script_data['iterations'])\n"
        << "parameters = script_data['parameters']\n"
        << "results = []\n"
        << "for i in range(iterations):\n"
        << "    try:\n"
        << "        results.append(simulate_once(parameters))\n"
        << "    except Exception as e:\n"
        << "        print(f'Error in iteration {i}: {e}', file=sys.stderr)\n"
        << "        break\n\n"
        << "if results:\n"
        << "    results_array = np.array(results, dtype=float)\n"
        << "    simulation_analysis = {\n"
        << "        'iterations_completed': len(results),\n"
        << "        'mean': float(np.mean(results_array)),\n"
        << "        'std': float(np.std(results_array)),\n"
        << "        'min': float(np.min(results_array)),\n"
        << "        'max': float(np.max(results_array)),\n"
        << "        'percentiles': {\n"
        << "            '5th': float(np.percentile(results_array, 5)),\n"
        << "            '25th': float(np.percentile(results_array, 25)),\n"
        << "            '50th': float(np.percentile(results_array, 50)),\n"
        << "            '75th': float(np.percentile(results_array, 75)),\n"
        << "            '95th': float(np.percentile(results_array, 95)),\n"
        << "        },\n"
        << "        'sample_results': results_array[:10].tolist(),\n"
        << "    }\n"
        << "    print(json.dumps(simulation_analysis, indent=2))\n"
        << "else:\n"
        << "    print(json.dumps({'error': 'No simulation results generated'}, indent=2))\n";
    return oss.str();
}

nlohmann::json RunSimulationTool::Execute(const nlohmann::json& arguments) {
    const auto script = arguments.at("simulation_script").get<std::string>();
    double requested_iterations = kDefaultIterations;
    if (arguments.contains("iterations") && arguments["iterations"].is_number()) {
        requested_iterations = arguments["iterations"].get<double>();
    }
    nlohmann::json parameters = nlohmann::json::object();
    if (arguments.contains("parameters") && arguments["parameters"].is_object()) {
        parameters = arguments["parameters"];
    }

    if (!(requested_iterations >= 1 && requested_iterations <= kMaxIterations)) {
        return ValidationError("iterations must be between 1 and " + std::to_string(kMaxIterations));
    }
    const int iterations = static_cast<int>(requested_iterations);
    static const std::regex kDefinesSimulateOnce(R"(def\s+simulate_once\s*\()");
    if (!std::regex_search(script, kDefinesSimulateOnce)) {
        return ValidationError("simulation_script must define simulate_once(parameters)");
    }
    if (auto rejected = ScreenFragment(runner_, script, "simulation_script")) {
        return *rejected;
    }

    sandbox::ExecutionRequest request{};
    request.script_text = BuildProgram(script);
    request.language = "python";
    request.data = {{"iterations", iterations}, {"parameters", parameters}};
    request.timeout_seconds = OptionalTimeout(arguments);
    return RunWrapped(runner_, request);
}

void RegisterScriptTools(ToolRegistry& registry, const sandbox::ScriptRunner& runner) {
    registry.Register(std::make_unique<ExecuteScriptTool>(runner, sandbox::Language::kPython));
    registry.Register(std::make_unique<ExecuteScriptTool>(runner, sandbox::Language::kR));
    registry.Register(std::make_unique<ExecuteScriptTool>(runner, sandbox::Language::kScilab));
    registry.Register(std::make_unique<OptimizeFunctionTool>(runner));
    registry.Register(std::make_unique<RunSimulationTool>(runner));
}

}  // namespace scriptbox::tools
