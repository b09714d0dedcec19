#include <gtest/gtest.h>

#include "sandbox/security_validator.hpp"
#include "tasks/script_generator.hpp"

namespace scriptbox::test {

using tasks::TemplateKind;

TEST(SelectTemplateTest, ExplicitExecutionTypeWins) {
    EXPECT_EQ(tasks::SelectTemplate("Validate results", "simulation"), TemplateKind::kSimulation);
    EXPECT_EQ(tasks::SelectTemplate("anything", "Optimization"), TemplateKind::kOptimization);
}

TEST(SelectTemplateTest, TaskNameDecidesOtherwise) {
    EXPECT_EQ(tasks::SelectTemplate("Mathematical Validation", "python"), TemplateKind::kValidation);
    EXPECT_EQ(tasks::SelectTemplate("Portfolio optimization step", "python"), TemplateKind::kOptimization);
    EXPECT_EQ(tasks::SelectTemplate("Risk SIMULATION", "python"), TemplateKind::kSimulation);
    EXPECT_EQ(tasks::SelectTemplate("Summarize quarter", "python"), TemplateKind::kAnalysis);
    EXPECT_EQ(tasks::SelectTemplate("", ""), TemplateKind::kAnalysis);
}

TEST(ExtractContextTest, SortsVariablesByShape) {
    const nlohmann::json variables = {
        {"revenue", 120.5},
        {"units", 3},
        {"label", "Q3"},
        {"recommendation", R"({"decision": "expand", "confidence_interval": "95% CI"})"},
        {"market_analysis", {{"trend", "up"}}},
        {"Risk_Analysis", {{"score", 0.2}}}
    };
    const auto context = tasks::ExtractContext(variables);
    ASSERT_EQ(context.numerical_data.size(), 2u);
    EXPECT_EQ(context.recommendation_data["decision"], "expand");
    EXPECT_EQ(context.analysis_results["trend"], "up");
    EXPECT_EQ(context.analysis_results["score"], 0.2);
}

TEST(ExtractContextTest, UnparsableRecommendationIsKeptRaw) {
    const auto context = tasks::ExtractContext({{"recommendation", "buy more widgets"}});
    EXPECT_EQ(context.recommendation_data["raw_recommendation"], "buy more widgets");
}

TEST(ExtractContextTest, NonObjectVariablesGiveEmptyContext) {
    const auto context = tasks::ExtractContext(nlohmann::json::array({1, 2}));
    EXPECT_TRUE(context.numerical_data.empty());
    EXPECT_TRUE(context.recommendation_data.empty());
}

TEST(GenerateScriptTest, CarriesContextAsScriptData) {
    const auto script = tasks::GenerateScript("Demand simulation", {{"demand", 40}, {"region", "north"}}, "python");
    EXPECT_EQ(script.kind, TemplateKind::kSimulation);
    EXPECT_EQ(script.data["task_name"], "Demand simulation");
    EXPECT_EQ(script.data["numerical_data"], nlohmann::json::array({40.0}));
    EXPECT_EQ(script.data["variables"]["region"], "north");
    EXPECT_NE(script.text.find("script_data['numerical_data']"), std::string::npos);
}

TEST(GenerateScriptTest, EveryTemplatePassesSecurityScreen) {
    const sandbox::SecurityValidator validator(true);
    for (const auto* kind : {"validation", "optimization", "simulation", "analysis"}) {
        const auto script = tasks::GenerateScript("task", nlohmann::json::object(), kind);
        EXPECT_EQ(tasks::ToString(script.kind), std::string(kind));
        const auto report = validator.Validate(script.text, sandbox::Language::kPython);
        EXPECT_TRUE(report.valid) << kind << ": " << report.ToJson().dump();
        EXPECT_GE(script.text.size(), 10u);
    }
}

TEST(TemplateKindTest, ParsesCaseInsensitively) {
    EXPECT_EQ(tasks::ParseTemplateKind("ANALYSIS"), TemplateKind::kAnalysis);
    EXPECT_FALSE(tasks::ParseTemplateKind("python").has_value());
}

}  // namespace scriptbox::test
