#include "sandbox/language_adapter.hpp"

#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "sandbox/execution_result.hpp"
#include "utils/common.hpp"

namespace scriptbox::sandbox {
namespace {

std::string CompactJson(const nlohmann::json& value) {
    return DumpJson(value, -1);
}

bool AllOf(const nlohmann::json& array, bool (nlohmann::json::*predicate)() const noexcept) {
    for (const auto& item : array) {
        if (!(item.*predicate)()) {
            return false;
        }
    }
    return true;
}

void RequireObject(const nlohmann::json& data, const char* language) {
    if (!data.is_object()) {
        throw std::invalid_argument(
            std::string("data for ") + language + " scripts must be an object of named values");
    }
}

std::string ExecutableName(const std::string& executable) {
    return std::filesystem::path(executable).filename().string();
}

const char kPythonSafetyHeader[] = R"(import os as _scriptbox_os
import builtins as _scriptbox_builtins
# Restrict file access to the workspace in sandbox mode
if _scriptbox_os.environ.get('SCRIPTBOX_SANDBOX_MODE', 'true').lower() == 'true':
    _scriptbox_open = _scriptbox_builtins.open
    _scriptbox_root = _scriptbox_os.path.realpath(_scriptbox_os.environ.get('SCRIPTBOX_TEMP_DIR', '/tmp'))
    def _scriptbox_safe_open(file, *args, **kwargs):
        if isinstance(file, (str, bytes, _scriptbox_os.PathLike)):
            target = _scriptbox_os.path.realpath(_scriptbox_os.fsdecode(file))
            if target != _scriptbox_root and not target.startswith(_scriptbox_root + _scriptbox_os.sep):
                raise PermissionError(f"File access denied: {file}")
        return _scriptbox_open(file, *args, **kwargs)
    _scriptbox_builtins.open = _scriptbox_safe_open

)";

}  // namespace

std::optional<Language> ParseLanguage(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "python" || lowered == "python3" || lowered == "py") {
        return Language::kPython;
    }
    if (lowered == "r") {
        return Language::kR;
    }
    if (lowered == "scilab") {
        return Language::kScilab;
    }
    return std::nullopt;
}

const char* ToString(Language language) {
    switch (language) {
        case Language::kPython: return "python";
        case Language::kR: return "R";
        case Language::kScilab: return "scilab";
    }
    return "python";
}

LanguageAdapter::LanguageAdapter(std::string executable)
    : executable_(std::move(executable)) {}

AssembledScript LanguageAdapter::Assemble(const std::string& user_code,
                                          const nlohmann::json& data,
                                          bool sandbox_enabled) const {
    AssembledScript assembled{};
    assembled.user_code = user_code;
    assembled.command = Command();
    if (sandbox_enabled) {
        assembled.text += SafetyHeader();
    }
    if (!data.is_null()) {
        assembled.text += RenderData(data);
    }
    assembled.text += user_code;
    if (!assembled.text.empty() && assembled.text.back() != '\n') {
        assembled.text.push_back('\n');
    }
    return assembled;
}

// Python

InterpreterCommand PythonAdapter::Command() const {
    InterpreterCommand command{};
    command.language = ToString(Lang());
    command.executable = executable_;
    command.args = {"-u"};
    command.file_extension = ".py";
    command.display_name = "Python (" + ExecutableName(executable_) + ")";
    command.install_hint = "Please install Python 3 to use Python script execution.";
    return command;
}

std::string PythonAdapter::StringLiteral(const std::string& value) {
    // A JSON string literal is also a valid Python string literal.
    return CompactJson(nlohmann::json(value));
}

std::string PythonAdapter::JsonLiteral(const nlohmann::json& value) {
    return "json.loads(" + StringLiteral(CompactJson(value)) + ")";
}

std::string PythonAdapter::RenderData(const nlohmann::json& data) const {
    return "import json\nscript_data = " + JsonLiteral(data) + "\n\n";
}

std::string PythonAdapter::SafetyHeader() const {
    return kPythonSafetyHeader;
}

// R

InterpreterCommand RAdapter::Command() const {
    InterpreterCommand command{};
    command.language = ToString(Lang());
    command.executable = executable_;
    command.file_extension = ".R";
    command.display_name = "R (" + ExecutableName(executable_) + ")";
    command.install_hint = "Please install R to use R script execution.";
    return command;
}

std::string RAdapter::Literal(const nlohmann::json& value) {
    if (value.is_null()) {
        return "NULL";
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "TRUE" : "FALSE";
    }
    if (value.is_number() || value.is_string()) {
        return CompactJson(value);
    }
    std::ostringstream oss;
    if (value.is_array()) {
        const bool flat = AllOf(value, &nlohmann::json::is_primitive);
        oss << (flat ? "c(" : "list(");
        bool first = true;
        for (const auto& item : value) {
            if (!first) {
                oss << ", ";
            }
            first = false;
            oss << ((flat && item.is_null()) ? std::string("NA") : Literal(item));
        }
        oss << ")";
        return oss.str();
    }
    oss << "list(";
    bool first = true;
    for (const auto& [key, item] : value.items()) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << CompactJson(nlohmann::json(key)) << " = " << Literal(item);
    }
    oss << ")";
    return oss.str();
}

std::string RAdapter::RenderData(const nlohmann::json& data) const {
    RequireObject(data, "R");
    static const std::regex kName("^[A-Za-z][A-Za-z0-9._]*$");
    std::ostringstream oss;
    oss << "# Data provided by scriptbox\n";
    for (const auto& [key, value] : data.items()) {
        if (!std::regex_match(key, kName)) {
            throw std::invalid_argument("invalid R variable name: '" + key + "'");
        }
        oss << key << " <- " << Literal(value) << "\n";
    }
    oss << "\n";
    return oss.str();
}

// Scilab

InterpreterCommand ScilabAdapter::Command() const {
    InterpreterCommand command{};
    command.language = ToString(Lang());
    command.executable = executable_;
    command.args = {"-nw", "-nb", "-quit", "-f"};
    command.file_extension = ".sce";
    command.display_name = "Scilab";
    command.install_hint = "Please install Scilab to use Scilab script execution.";
    return command;
}

std::string ScilabAdapter::Literal(const nlohmann::json& value) {
    if (value.is_null()) {
        return "[]";
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "%t" : "%f";
    }
    if (value.is_number()) {
        return CompactJson(value);
    }
    if (value.is_string()) {
        // Scilab has no escapes: quotes are doubled, control characters
        // are spliced in with ascii().
        std::string out = "\"";
        for (unsigned char c : value.get<std::string>()) {
            if (c == '"' || c == '\'') {
                out.push_back(static_cast<char>(c));
                out.push_back(static_cast<char>(c));
            } else if (c < 0x20) {
                out += "\" + ascii(" + std::to_string(static_cast<int>(c)) + ") + \"";
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
        out.push_back('"');
        return out;
    }
    std::ostringstream oss;
    if (value.is_array()) {
        if (value.empty()) {
            return "[]";
        }
        const bool homogeneous = AllOf(value, &nlohmann::json::is_number) ||
                                 AllOf(value, &nlohmann::json::is_boolean) ||
                                 AllOf(value, &nlohmann::json::is_string);
        oss << (homogeneous ? "[" : "list(");
        bool first = true;
        for (const auto& item : value) {
            if (!first) {
                oss << (homogeneous ? " " : ", ");
            }
            first = false;
            oss << Literal(item);
        }
        oss << (homogeneous ? "]" : ")");
        return oss.str();
    }
    if (value.empty()) {
        return "struct()";
    }
    oss << "struct(";
    bool first = true;
    for (const auto& [key, item] : value.items()) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << Literal(nlohmann::json(key)) << ", " << Literal(item);
    }
    oss << ")";
    return oss.str();
}

std::string ScilabAdapter::RenderData(const nlohmann::json& data) const {
    RequireObject(data, "Scilab");
    static const std::regex kName("^[A-Za-z_][A-Za-z0-9_]*$");
    std::ostringstream oss;
    oss << "// Data provided by scriptbox\n";
    for (const auto& [key, value] : data.items()) {
        if (!std::regex_match(key, kName)) {
            throw std::invalid_argument("invalid Scilab variable name: '" + key + "'");
        }
        oss << key << " = " << Literal(value) << ";\n";
    }
    oss << "\n";
    return oss.str();
}

std::unique_ptr<LanguageAdapter> CreateAdapter(Language language,
                                               const config::InterpretersConfig& interpreters) {
    switch (language) {
        case Language::kPython:
            return std::make_unique<PythonAdapter>(interpreters.python);
        case Language::kR:
            return std::make_unique<RAdapter>(interpreters.rscript);
        case Language::kScilab:
            return std::make_unique<ScilabAdapter>(interpreters.scilab);
    }
    return nullptr;
}

}  // namespace scriptbox::sandbox
