#include "tasks/task_processor.hpp"

#include <cctype>
#include <chrono>
#include <utility>

#include "sandbox/language_adapter.hpp"
#include "tasks/script_generator.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::tasks {
namespace {

std::size_t NonBlankLength(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            ++count;
        }
    }
    return count;
}

std::string StringField(const nlohmann::json& object, const char* key, const std::string& fallback) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

}  // namespace

TaskProcessor::TaskProcessor(const sandbox::ScriptRunner& runner, std::string service_name)
    : runner_(runner)
    , service_name_(std::move(service_name)) {}

TaskResponse TaskProcessor::Process(const nlohmann::json& request) const {
    const auto started = std::chrono::steady_clock::now();
    TaskResponse response{};
    if (!request.is_object()) {
        response.http_status = 400;
        response.body = {{"status", "error"}, {"message", "Request body must be a JSON object"}};
        return response;
    }

    const auto task_name = StringField(request, "task_name", "script_execution");
    nlohmann::json variables = nlohmann::json::object();
    if (request.contains("variables") && request["variables"].is_object()) {
        variables = request["variables"];
    }
    const auto execution_type = StringField(variables, "execution_type", "python");
    auto script_content = StringField(variables, "script_content", "");
    const bool generated = script_content.empty();

    utils::Log(utils::LogLevel::kInfo, "task", "processing",
               {{"task_name", task_name}, {"execution_type", execution_type}});

    sandbox::ExecutionRequest execution{};
    std::string template_name;
    if (generated) {
        auto script = GenerateScript(task_name, variables, execution_type);
        template_name = ToString(script.kind);
        script_content = std::move(script.text);
        execution.language = "python";
        execution.data = std::move(script.data);
        utils::Log(utils::LogLevel::kInfo, "task", "script generated",
                   {{"template", template_name}, {"length", std::to_string(script_content.size())}});
    } else {
        const auto language = sandbox::ParseLanguage(execution_type);
        execution.language = language ? sandbox::ToString(*language) : "python";
        if (variables.contains("parameters") && variables["parameters"].is_object() &&
            !variables["parameters"].empty()) {
            execution.data = variables["parameters"];
        }
    }

    if (NonBlankLength(script_content) < kMinScriptLength) {
        nlohmann::json keys = nlohmann::json::array();
        for (const auto& item : variables.items()) {
            keys.push_back(item.key());
        }
        response.http_status = 400;
        response.body = {
            {"status", "error"},
            {"message", "No script_content provided and could not generate adequate content from context"},
            {"available_variables", keys},
            {"task_name", task_name},
            {"execution_type", execution_type},
            {"suggested_execution_types", {"optimization", "simulation", "validation", "analysis"}}
        };
        return response;
    }

    const auto validation = runner_.Validate(script_content, execution.language);
    if (!validation.valid) {
        utils::Log(utils::LogLevel::kWarn, "task", "script rejected", {{"task_name", task_name}});
        response.http_status = 400;
        response.body = {
            {"status", "error"},
            {"message", "Script failed security validation"},
            {"validation_warnings", validation.Warnings()},
            {"error_type", sandbox::ToString(sandbox::ErrorKind::kSecurityViolation)}
        };
        return response;
    }

    execution.script_text = script_content;
    if (variables.contains("timeout") && variables["timeout"].is_number_integer()) {
        execution.timeout_seconds = sandbox::TimeoutFromJson(variables["timeout"]);
    }
    const auto result = runner_.Run(execution);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    nlohmann::json body_result = {
        {"execution_type", execution_type},
        {"language", execution.language},
        {"script_validation", validation.ToJson()},
        {"execution_results", sandbox::ToJson(result)},
        {"processed_by", service_name_},
        {"processed_at", utils::FormatIsoTimestamp(utils::Now())},
        {"processing_time_ms", elapsed.count()},
        {"sandbox_mode", runner_.Settings().sandbox.enabled}
    };
    if (generated) {
        body_result["script_generated"] = script_content;
        body_result["template"] = template_name;
    } else {
        body_result["script_generated"] = false;
    }
    response.body = {{"status", "success"}, {"result", std::move(body_result)}};
    return response;
}

}  // namespace scriptbox::tasks
