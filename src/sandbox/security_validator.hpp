#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/language_adapter.hpp"

namespace scriptbox::sandbox {

struct DenyPattern {
    std::string pattern;
    std::string severity;
};

struct SecurityFinding {
    std::string pattern;
    std::string severity;
};

struct ValidationReport {
    bool valid = true;
    bool sandbox_mode = true;
    // True when sandbox mode is off and nothing was scanned.
    bool skipped = false;
    std::vector<SecurityFinding> findings;

    std::vector<std::string> Warnings() const;
    nlohmann::json ToJson() const;
};

// Substring deny-list scan. A coarse pre-filter: a clean report is not a
// guarantee that the script is harmless.
class SecurityValidator {
public:
    explicit SecurityValidator(bool sandbox_enabled);

    ValidationReport Validate(const std::string& script, Language language) const;
    // Unknown languages have no deny-list and always pass.
    ValidationReport Validate(const std::string& script, const std::string& language) const;

    bool SandboxEnabled() const { return sandbox_enabled_; }

    static const std::vector<DenyPattern>& PatternsFor(Language language);

private:
    ValidationReport Scan(const std::string& script, const std::vector<DenyPattern>& patterns) const;

    bool sandbox_enabled_;
};

}  // namespace scriptbox::sandbox
