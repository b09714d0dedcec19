#include "sandbox/script_runner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "sandbox/language_adapter.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {

std::optional<int> TimeoutFromJson(const nlohmann::json& value) {
    if (!value.is_number()) {
        return std::nullopt;
    }
    const double seconds = value.get<double>();
    if (!std::isfinite(seconds)) {
        return std::nullopt;
    }
    const double low = std::numeric_limits<int>::min();
    const double high = std::numeric_limits<int>::max();
    return static_cast<int>(std::clamp(seconds, low, high));
}

ScriptRunner::ScriptRunner(config::Config config)
    : config_(std::move(config))
    , executor_(MakeSandboxOptions(config_.sandbox))
    , validator_(config_.sandbox.enabled) {}

std::chrono::seconds ScriptRunner::ResolveTimeout(std::optional<int> requested) const {
    const int value = requested.value_or(config_.sandbox.default_timeout_s);
    return std::chrono::seconds(std::clamp(value, 1, std::max(1, config_.sandbox.max_timeout_s)));
}

ValidationReport ScriptRunner::Validate(const std::string& script, const std::string& language) const {
    return validator_.Validate(script, language);
}

ExecutionResult ScriptRunner::Run(const ExecutionRequest& request) const {
    const auto script_id = utils::RandomHex(8);
    const auto language = ParseLanguage(request.language);
    if (!language) {
        return MakeFailure(ErrorKind::kValidation,
                           "Unsupported language: " + request.language,
                           script_id, request.language);
    }
    const auto adapter = CreateAdapter(*language, config_.interpreters);
    const std::string label = ToString(*language);

    const auto report = validator_.Validate(request.script_text, *language);
    if (!report.valid) {
        utils::Log(utils::LogLevel::kWarn, "security", "script rejected",
                   {{"script_id", script_id},
                    {"language", label},
                    {"findings", std::to_string(report.findings.size())}});
        return MakeFailure(ErrorKind::kSecurityViolation,
                           "Script failed security validation: " + utils::Join(report.Warnings(), "; "),
                           script_id, label);
    }

    AssembledScript assembled{};
    try {
        assembled = adapter->Assemble(request.script_text, request.data, config_.sandbox.enabled);
    } catch (const std::invalid_argument& ex) {
        return MakeFailure(ErrorKind::kValidation, ex.what(), script_id, label);
    }

    return executor_.Execute(assembled.text,
                             assembled.command,
                             ResolveTimeout(request.timeout_seconds),
                             script_id);
}

}  // namespace scriptbox::sandbox
