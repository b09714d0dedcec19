#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/interpreter_command.hpp"

namespace scriptbox::sandbox {

enum class Language {
    kPython,
    kR,
    kScilab
};

// Accepts "python", "r"/"R", "scilab" in any case.
std::optional<Language> ParseLanguage(const std::string& value);
const char* ToString(Language language);

struct AssembledScript {
    std::string text;
    // Caller-controlled code; the part the SecurityValidator inspects.
    std::string user_code;
    InterpreterCommand command;
};

class LanguageAdapter {
public:
    explicit LanguageAdapter(std::string executable);
    virtual ~LanguageAdapter() = default;

    virtual Language Lang() const = 0;
    virtual InterpreterCommand Command() const = 0;

    // Statements that define the structured data before user code runs.
    // Throws std::invalid_argument when the data cannot be expressed.
    virtual std::string RenderData(const nlohmann::json& data) const = 0;

    // Best-effort in-language guard, prepended when sandbox mode is on.
    virtual std::string SafetyHeader() const { return {}; }

    AssembledScript Assemble(const std::string& user_code,
                             const nlohmann::json& data,
                             bool sandbox_enabled) const;

protected:
    std::string executable_;
};

class PythonAdapter : public LanguageAdapter {
public:
    using LanguageAdapter::LanguageAdapter;

    Language Lang() const override { return Language::kPython; }
    InterpreterCommand Command() const override;
    std::string RenderData(const nlohmann::json& data) const override;
    std::string SafetyHeader() const override;

    // A Python expression evaluating to exactly `value`.
    static std::string JsonLiteral(const nlohmann::json& value);
    static std::string StringLiteral(const std::string& value);
};

class RAdapter : public LanguageAdapter {
public:
    using LanguageAdapter::LanguageAdapter;

    Language Lang() const override { return Language::kR; }
    InterpreterCommand Command() const override;
    std::string RenderData(const nlohmann::json& data) const override;

    static std::string Literal(const nlohmann::json& value);
};

class ScilabAdapter : public LanguageAdapter {
public:
    using LanguageAdapter::LanguageAdapter;

    Language Lang() const override { return Language::kScilab; }
    InterpreterCommand Command() const override;
    std::string RenderData(const nlohmann::json& data) const override;

    static std::string Literal(const nlohmann::json& value);
};

std::unique_ptr<LanguageAdapter> CreateAdapter(Language language,
                                               const config::InterpretersConfig& interpreters);

}  // namespace scriptbox::sandbox
