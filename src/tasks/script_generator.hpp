#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace scriptbox::tasks {

enum class TemplateKind {
    kValidation,
    kOptimization,
    kSimulation,
    kAnalysis
};

const char* ToString(TemplateKind kind);
std::optional<TemplateKind> ParseTemplateKind(const std::string& value);

// An explicit template name in `execution_type` wins; otherwise the task
// name decides, falling back to analysis.
TemplateKind SelectTemplate(const std::string& task_name, const std::string& execution_type);

// Values pulled out of workflow variables for the templates.
struct TaskContext {
    std::vector<double> numerical_data;
    nlohmann::json recommendation_data = nlohmann::json::object();
    nlohmann::json analysis_results = nlohmann::json::object();
};

TaskContext ExtractContext(const nlohmann::json& variables);

struct GeneratedScript {
    TemplateKind kind = TemplateKind::kAnalysis;
    // Python source; reads its inputs from script_data.
    std::string text;
    nlohmann::json data = nlohmann::json::object();
};

GeneratedScript GenerateScript(const std::string& task_name,
                               const nlohmann::json& variables,
                               const std::string& execution_type);

}  // namespace scriptbox::tasks
