#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace scriptbox::sandbox {

enum class ExecutionState {
    kCreated,
    kRunning,
    kCompleted,
    kFailed,
    kTimedOut
};

enum class ErrorKind {
    kNone,
    kValidation,
    kSecurityViolation,
    kInterpreterNotFound,
    kExecutionTimeout,
    kRuntimeFailure,
    kSourceFetch,
    kInternal
};

const char* ToString(ExecutionState state);
const char* ToString(ErrorKind kind);

struct ExecutionResult {
    bool success = false;
    ExecutionState state = ExecutionState::kCreated;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    std::string script_id;
    std::string language;
    ErrorKind error_kind = ErrorKind::kNone;
    std::string error;
    double duration_s = 0.0;

    bool HasError() const { return error_kind != ErrorKind::kNone; }
};

ExecutionResult MakeFailure(ErrorKind kind,
                            std::string error,
                            std::string script_id,
                            std::string language);

// {success, stdout, stderr, return_code, script_id, language} on success,
// {success:false, error, error_type, script_id, language} otherwise.
nlohmann::json ToJson(const ExecutionResult& result);

// Script output is raw bytes; invalid UTF-8 is written as U+FFFD.
std::string DumpJson(const nlohmann::json& value, int indent = 2);

}  // namespace scriptbox::sandbox
