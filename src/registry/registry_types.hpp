#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"

namespace scriptbox::registry {

enum class SourceType {
    kInline,
    kLocalFile,
    kRemoteServer,
    kGitRepository
};

// "inline" (alias "direct_content"), "local_file", "remote_server",
// "git_repository".
std::optional<SourceType> ParseSourceType(const std::string& value);
const char* ToString(SourceType type);

struct ScriptRegistryEntry {
    std::string id;
    std::string name;
    std::string description;
    std::string category = "general";
    // as written in the catalog, kept for unsupported types
    std::string source_type_name;
    std::optional<SourceType> source_type;
    std::string source_location;
    // file inside the repository for git sources
    std::string source_path;
    std::string script_content;
    std::string execution_type;
    nlohmann::json input_schema = nlohmann::json::object();
    nlohmann::json output_schema = nlohmann::json::object();
    nlohmann::json llm_template_instructions = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    int timeout_s = 300;
    nlohmann::json raw = nlohmann::json::object();
};

ScriptRegistryEntry EntryFromJson(const std::string& id, const nlohmann::json& data);
nlohmann::json ToSummaryJson(const ScriptRegistryEntry& entry);

// Execution envelope of a registry script.
struct ScriptOutcome {
    bool success = false;
    std::string script_id;
    nlohmann::json result = nlohmann::json::object();
    sandbox::ErrorKind error_kind = sandbox::ErrorKind::kNone;
    std::string error;
    std::vector<std::string> validation_errors;
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json execution_metadata = nlohmann::json::object();

    nlohmann::json ToJson() const;
};

ScriptOutcome MakeErrorOutcome(sandbox::ErrorKind kind, std::string error, std::string script_id = {});

}  // namespace scriptbox::registry
