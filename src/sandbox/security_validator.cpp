#include "sandbox/security_validator.hpp"

#include "utils/logging.hpp"

namespace scriptbox::sandbox {

std::vector<std::string> ValidationReport::Warnings() const {
    std::vector<std::string> warnings;
    warnings.reserve(findings.size());
    for (const auto& finding : findings) {
        warnings.push_back("Potentially dangerous pattern detected: " + finding.pattern);
    }
    return warnings;
}

nlohmann::json ValidationReport::ToJson() const {
    nlohmann::json json = nlohmann::json::object();
    json["valid"] = valid;
    json["warnings"] = Warnings();
    json["findings"] = nlohmann::json::array();
    for (const auto& finding : findings) {
        json["findings"].push_back({{"pattern", finding.pattern}, {"severity", finding.severity}});
    }
    json["sandbox_mode"] = sandbox_mode;
    json["skipped"] = skipped;
    return json;
}

SecurityValidator::SecurityValidator(bool sandbox_enabled)
    : sandbox_enabled_(sandbox_enabled) {}

const std::vector<DenyPattern>& SecurityValidator::PatternsFor(Language language) {
    static const std::vector<DenyPattern> kPythonPatterns = {
        {"os.system", "high"},
        {"subprocess", "high"},
        {"exec", "high"},
        {"eval", "high"},
        {"__import__", "high"},
        {"open(", "medium"}
    };
    static const std::vector<DenyPattern> kRPatterns = {
        {"system", "high"},
        {"shell", "high"},
        {"file.create", "medium"},
        {"file.remove", "medium"}
    };
    static const std::vector<DenyPattern> kScilabPatterns = {
        {"unix", "high"},
        {"host", "high"},
        {"exec", "high"},
        {"load", "medium"},
        {"save", "medium"}
    };
    switch (language) {
        case Language::kPython: return kPythonPatterns;
        case Language::kR: return kRPatterns;
        case Language::kScilab: return kScilabPatterns;
    }
    return kPythonPatterns;
}

ValidationReport SecurityValidator::Scan(const std::string& script,
                                         const std::vector<DenyPattern>& patterns) const {
    ValidationReport report{};
    report.sandbox_mode = sandbox_enabled_;
    if (!sandbox_enabled_) {
        report.skipped = true;
        utils::Log(utils::LogLevel::kDebug, "security", "validation skipped, sandbox mode disabled");
        return report;
    }
    for (const auto& deny : patterns) {
        if (script.find(deny.pattern) != std::string::npos) {
            report.findings.push_back(SecurityFinding{deny.pattern, deny.severity});
        }
    }
    report.valid = report.findings.empty();
    return report;
}

ValidationReport SecurityValidator::Validate(const std::string& script, Language language) const {
    return Scan(script, PatternsFor(language));
}

ValidationReport SecurityValidator::Validate(const std::string& script,
                                             const std::string& language) const {
    const auto parsed = ParseLanguage(language);
    if (!parsed) {
        static const std::vector<DenyPattern> kNone;
        return Scan(script, kNone);
    }
    return Validate(script, *parsed);
}

}  // namespace scriptbox::sandbox
