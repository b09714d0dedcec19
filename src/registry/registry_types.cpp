#include "registry/registry_types.hpp"

#include <algorithm>
#include <utility>

#include "sandbox/script_runner.hpp"

namespace scriptbox::registry {
namespace {

// Mistyped or null fields read as absent.
std::string StringField(const nlohmann::json& data, const char* key, const std::string& fallback) {
    const auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<int> TimeoutField(const nlohmann::json& data) {
    const auto it = data.find("timeout");
    if (it == data.end()) {
        return std::nullopt;
    }
    const auto timeout = sandbox::TimeoutFromJson(*it);
    if (!timeout) {
        return std::nullopt;
    }
    return std::max(*timeout, 0);
}

}  // namespace

std::optional<SourceType> ParseSourceType(const std::string& value) {
    if (value == "inline" || value == "direct_content") {
        return SourceType::kInline;
    }
    if (value == "local_file") {
        return SourceType::kLocalFile;
    }
    if (value == "remote_server") {
        return SourceType::kRemoteServer;
    }
    if (value == "git_repository") {
        return SourceType::kGitRepository;
    }
    return std::nullopt;
}

const char* ToString(SourceType type) {
    switch (type) {
        case SourceType::kInline: return "inline";
        case SourceType::kLocalFile: return "local_file";
        case SourceType::kRemoteServer: return "remote_server";
        case SourceType::kGitRepository: return "git_repository";
    }
    return "unknown";
}

ScriptRegistryEntry EntryFromJson(const std::string& id, const nlohmann::json& data) {
    ScriptRegistryEntry entry{};
    entry.id = StringField(data, "id", id);
    if (entry.id.empty()) {
        entry.id = id;
    }
    entry.name = StringField(data, "name", "Unknown");
    entry.description = StringField(data, "description", "");
    entry.category = StringField(data, "category", "general");
    entry.source_type_name = StringField(data, "source_type", "local_file");
    entry.source_type = ParseSourceType(entry.source_type_name);
    entry.source_location = StringField(data, "source_location", "");
    entry.source_path = StringField(data, "source_path", "");
    entry.script_content = StringField(data, "script_content", "");
    entry.execution_type = StringField(data, "execution_type", "unknown");
    if (data.contains("input_schema") && data["input_schema"].is_object()) {
        entry.input_schema = data["input_schema"];
    }
    if (data.contains("output_schema") && data["output_schema"].is_object()) {
        entry.output_schema = data["output_schema"];
    }
    if (data.contains("llm_template_instructions") && data["llm_template_instructions"].is_object()) {
        entry.llm_template_instructions = data["llm_template_instructions"];
    }
    if (data.contains("metadata") && data["metadata"].is_object()) {
        entry.metadata = data["metadata"];
    }
    if (const auto timeout = TimeoutField(data)) {
        entry.timeout_s = *timeout;
    }
    entry.raw = data;
    return entry;
}

nlohmann::json ToSummaryJson(const ScriptRegistryEntry& entry) {
    return {
        {"id", entry.id},
        {"name", entry.name},
        {"description", entry.description},
        {"category", entry.category},
        {"source_type", entry.source_type_name},
        {"execution_type", entry.execution_type},
        {"complexity", StringField(entry.metadata, "complexity", "unknown")},
        {"estimated_execution_time", entry.metadata.value("estimated_execution_time", nlohmann::json(0))}
    };
}

nlohmann::json ScriptOutcome::ToJson() const {
    nlohmann::json json = nlohmann::json::object();
    json["status"] = success ? "success" : "error";
    json["script_id"] = script_id;
    if (success) {
        json["result"] = result;
    } else {
        json["error"] = error;
        json["error_type"] = sandbox::ToString(error_kind);
        if (!validation_errors.empty()) {
            json["validation_errors"] = validation_errors;
        }
        if (!result.empty()) {
            json["details"] = result;
        }
    }
    if (!stdout_text.empty()) {
        json["stdout"] = stdout_text;
    }
    if (!stderr_text.empty()) {
        json["stderr"] = stderr_text;
    }
    json["execution_metadata"] = execution_metadata;
    return json;
}

ScriptOutcome MakeErrorOutcome(sandbox::ErrorKind kind, std::string error, std::string script_id) {
    ScriptOutcome outcome{};
    outcome.success = false;
    outcome.error_kind = kind;
    outcome.error = std::move(error);
    outcome.script_id = std::move(script_id);
    return outcome;
}

}  // namespace scriptbox::registry
