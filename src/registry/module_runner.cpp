#include "registry/module_runner.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "utils/logging.hpp"

namespace scriptbox::registry {
namespace {

std::string DriverPrologue(const nlohmann::json& input_data) {
    std::ostringstream oss;
    oss << "import json\n"
        << "import sys as _scriptbox_sys\n"
        << "import types as _scriptbox_types\n"
        << "import importlib.util as _scriptbox_importlib\n\n"
        << "input_data = " << sandbox::PythonAdapter::JsonLiteral(input_data) << "\n\n"
        << "def _scriptbox_fail(message):\n"
        << "    print(" << sandbox::PythonAdapter::StringLiteral(ModuleRunner::kErrorMarker)
        << " + json.dumps({\"error\": message}))\n"
        << "    _scriptbox_sys.exit(3)\n\n";
    return oss.str();
}

std::string DriverEpilogue() {
    std::ostringstream oss;
    oss << "if not hasattr(_scriptbox_module, 'execute'):\n"
        << "    _scriptbox_fail(\"Script must have an 'execute' function\")\n"
        << "_scriptbox_result = _scriptbox_module.execute(input_data)\n"
        << "if not isinstance(_scriptbox_result, dict):\n"
        << "    _scriptbox_result = {'result': _scriptbox_result}\n"
        << "_scriptbox_sys.stdout.flush()\n"
        << "print(" << sandbox::PythonAdapter::StringLiteral(ModuleRunner::kResultMarker)
        << " + json.dumps(_scriptbox_result, default=str))\n";
    return oss.str();
}

std::string LastNonEmptyLine(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            last = line;
        }
    }
    return last;
}

// Splits driver stdout into the marked payload and whatever the module printed.
bool ExtractMarked(const std::string& stdout_text,
                   const std::string& marker,
                   std::string& payload,
                   std::string& remaining) {
    std::istringstream stream(stdout_text);
    std::ostringstream rest;
    std::string line;
    bool found = false;
    while (std::getline(stream, line)) {
        if (line.rfind(marker, 0) == 0) {
            payload = line.substr(marker.size());
            found = true;
            continue;
        }
        rest << line << "\n";
    }
    remaining = rest.str();
    return found;
}

}  // namespace

ModuleRunner::ModuleRunner(const sandbox::SandboxExecutor& executor,
                           std::string python_executable,
                           bool sandbox_enabled,
                           int max_timeout_s)
    : executor_(executor)
    , adapter_(std::move(python_executable))
    , sandbox_enabled_(sandbox_enabled)
    , max_timeout_s_(max_timeout_s) {}

std::string ModuleRunner::BuildFileDriver(const std::filesystem::path& module_path,
                                          const nlohmann::json& input_data) {
    const auto path_literal = sandbox::PythonAdapter::StringLiteral(module_path.string());
    std::ostringstream oss;
    oss << DriverPrologue(input_data)
        << "_scriptbox_spec = _scriptbox_importlib.spec_from_file_location('analysis_script', "
        << path_literal << ")\n"
        << "if _scriptbox_spec is None or _scriptbox_spec.loader is None:\n"
        << "    _scriptbox_fail('Could not load script: ' + " << path_literal << ")\n"
        << "_scriptbox_module = _scriptbox_importlib.module_from_spec(_scriptbox_spec)\n"
        << "_scriptbox_spec.loader.exec_module(_scriptbox_module)\n"
        << DriverEpilogue();
    return oss.str();
}

std::string ModuleRunner::BuildSourceDriver(const std::string& source,
                                            const std::string& origin,
                                            const nlohmann::json& input_data) {
    std::ostringstream oss;
    oss << DriverPrologue(input_data)
        << "_scriptbox_module = _scriptbox_types.ModuleType('analysis_script')\n"
        << "_scriptbox_code = compile(" << sandbox::PythonAdapter::StringLiteral(source) << ", "
        << sandbox::PythonAdapter::StringLiteral(origin) << ", 'exec')\n"
        << "exec(_scriptbox_code, _scriptbox_module.__dict__)\n"
        << DriverEpilogue();
    return oss.str();
}

ScriptOutcome ModuleRunner::RunFile(const std::filesystem::path& module_path,
                                    const ScriptRegistryEntry& entry,
                                    const nlohmann::json& input_data) const {
    return Run(BuildFileDriver(module_path, input_data), entry);
}

ScriptOutcome ModuleRunner::RunSource(const std::string& source,
                                      const ScriptRegistryEntry& entry,
                                      const nlohmann::json& input_data) const {
    return Run(BuildSourceDriver(source, "<registry:" + entry.id + ">", input_data), entry);
}

ScriptOutcome ModuleRunner::Run(const std::string& driver, const ScriptRegistryEntry& entry) const {
    const auto assembled = adapter_.Assemble(driver, nullptr, sandbox_enabled_);
    const auto timeout = std::chrono::seconds(std::clamp(entry.timeout_s, 1, std::max(1, max_timeout_s_)));
    const auto execution = executor_.Execute(assembled.text, assembled.command, timeout);

    ScriptOutcome outcome{};
    outcome.script_id = entry.id;
    outcome.stderr_text = execution.stderr_text;
    outcome.execution_metadata["sandbox_script_id"] = execution.script_id;
    outcome.execution_metadata["sandbox_duration"] = execution.duration_s;

    std::string payload;
    std::string remaining;
    if (ExtractMarked(execution.stdout_text, kErrorMarker, payload, remaining)) {
        outcome.stdout_text = remaining;
        auto details = nlohmann::json::parse(payload, nullptr, false);
        outcome.error_kind = sandbox::ErrorKind::kRuntimeFailure;
        outcome.error = (!details.is_discarded() && details.is_object())
                            ? details.value("error", std::string("Script failed to load"))
                            : std::string("Script failed to load");
        return outcome;
    }

    if (execution.HasError() && execution.error_kind != sandbox::ErrorKind::kRuntimeFailure) {
        outcome.stdout_text = execution.stdout_text;
        outcome.error_kind = execution.error_kind;
        outcome.error = execution.error;
        return outcome;
    }

    if (!ExtractMarked(execution.stdout_text, kResultMarker, payload, remaining)) {
        outcome.stdout_text = execution.stdout_text;
        outcome.error_kind = sandbox::ErrorKind::kRuntimeFailure;
        const auto reason = LastNonEmptyLine(execution.stderr_text);
        outcome.error = "Script execution failed" + (reason.empty() ? std::string() : ": " + reason);
        return outcome;
    }

    outcome.stdout_text = remaining;
    auto result = nlohmann::json::parse(payload, nullptr, false);
    if (result.is_discarded() || !result.is_object()) {
        outcome.error_kind = sandbox::ErrorKind::kRuntimeFailure;
        outcome.error = "Script returned a result that is not valid JSON";
        return outcome;
    }
    outcome.success = true;
    outcome.result = std::move(result);
    outcome.result["status"] = "success";
    return outcome;
}

}  // namespace scriptbox::registry
