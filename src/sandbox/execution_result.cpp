#include "sandbox/execution_result.hpp"

#include <utility>

namespace scriptbox::sandbox {

const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kCreated: return "created";
        case ExecutionState::kRunning: return "running";
        case ExecutionState::kCompleted: return "completed";
        case ExecutionState::kFailed: return "failed";
        case ExecutionState::kTimedOut: return "timed_out";
    }
    return "unknown";
}

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kValidation: return "validation_error";
        case ErrorKind::kSecurityViolation: return "security_violation";
        case ErrorKind::kInterpreterNotFound: return "interpreter_not_found";
        case ErrorKind::kExecutionTimeout: return "execution_timeout";
        case ErrorKind::kRuntimeFailure: return "runtime_failure";
        case ErrorKind::kSourceFetch: return "source_fetch_error";
        case ErrorKind::kInternal: return "internal_error";
    }
    return "internal_error";
}

ExecutionResult MakeFailure(ErrorKind kind,
                            std::string error,
                            std::string script_id,
                            std::string language) {
    ExecutionResult result{};
    result.success = false;
    result.state = ExecutionState::kFailed;
    result.error_kind = kind;
    result.error = std::move(error);
    result.script_id = std::move(script_id);
    result.language = std::move(language);
    return result;
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["success"] = result.success;
    if (result.error.empty()) {
        json["stdout"] = result.stdout_text;
        json["stderr"] = result.stderr_text;
        json["return_code"] = result.exit_code.has_value() ? nlohmann::json(*result.exit_code)
                                                           : nlohmann::json(nullptr);
        if (result.HasError()) {
            json["error_type"] = ToString(result.error_kind);
        }
    } else {
        json["error"] = result.error;
        json["error_type"] = ToString(result.error_kind);
        // partial output survives failures such as timeouts
        if (!result.stdout_text.empty()) {
            json["stdout"] = result.stdout_text;
        }
        if (!result.stderr_text.empty()) {
            json["stderr"] = result.stderr_text;
        }
        if (result.exit_code.has_value()) {
            json["return_code"] = *result.exit_code;
        }
    }
    json["script_id"] = result.script_id;
    json["language"] = result.language;
    json["state"] = ToString(result.state);
    json["duration_s"] = result.duration_s;
    return json;
}

std::string DumpJson(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace scriptbox::sandbox
