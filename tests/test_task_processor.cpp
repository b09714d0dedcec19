#include <gtest/gtest.h>

#include "sandbox/script_runner.hpp"
#include "tasks/task_processor.hpp"
#include "test_support.hpp"

namespace scriptbox::test {

using tasks::TaskProcessor;

class TaskProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_unique<sandbox::ScriptRunner>(MakeTestConfig(temp_.Path()));
        processor_ = std::make_unique<TaskProcessor>(*runner_, "script-execution");
    }

    TempDir temp_;
    std::unique_ptr<sandbox::ScriptRunner> runner_;
    std::unique_ptr<TaskProcessor> processor_;
};

TEST_F(TaskProcessorTest, NonObjectBodyIsBadRequest) {
    const auto response = processor_->Process(nlohmann::json::array());
    EXPECT_EQ(response.http_status, 400);
    EXPECT_EQ(response.body["status"], "error");
}

TEST_F(TaskProcessorTest, TooShortScriptIsBadRequest) {
    const auto response = processor_->Process({
        {"task_name", "Tiny"},
        {"variables", {{"script_content", "x = 1"}, {"execution_type", "python"}}}
    });
    EXPECT_EQ(response.http_status, 400);
    EXPECT_EQ(response.body["message"],
              "No script_content provided and could not generate adequate content from context");
    EXPECT_EQ(response.body["available_variables"].size(), 2u);
    EXPECT_EQ(response.body["suggested_execution_types"].size(), 4u);
}

TEST_F(TaskProcessorTest, DangerousScriptIsBadRequest) {
    const auto response = processor_->Process({
        {"task_name", "Sneaky"},
        {"variables", {{"script_content", "import subprocess\nsubprocess.run(['id'])"}}}
    });
    EXPECT_EQ(response.http_status, 400);
    EXPECT_EQ(response.body["message"], "Script failed security validation");
    EXPECT_EQ(response.body["validation_warnings"][0], "Potentially dangerous pattern detected: subprocess");
}

TEST_F(TaskProcessorTest, RunsSuppliedScriptWithParameters) {
    if (!HasExecutable("python3")) {
        GTEST_SKIP() << "python3 is not available";
    }
    const auto response = processor_->Process({
        {"task_name", "Add one"},
        {"variables", {
            {"script_content", "print(script_data['n'] + 1)"},
            {"execution_type", "python"},
            {"parameters", {{"n", 41}}}
        }}
    });
    ASSERT_EQ(response.http_status, 200) << response.body.dump();
    const auto& result = response.body["result"];
    EXPECT_EQ(response.body["status"], "success");
    EXPECT_EQ(result["execution_results"]["stdout"], "42\n");
    EXPECT_EQ(result["script_generated"], false);
    EXPECT_EQ(result["processed_by"], "script-execution");
    EXPECT_EQ(result["language"], "python");
    EXPECT_TRUE(result["script_validation"]["valid"].get<bool>());
    EXPECT_TRUE(result["sandbox_mode"].get<bool>());
}

TEST_F(TaskProcessorTest, FailingScriptStillAnswersOk) {
    if (!HasExecutable("python3")) {
        GTEST_SKIP() << "python3 is not available";
    }
    const auto response = processor_->Process({
        {"variables", {{"script_content", "raise ValueError('bad input')"}}}
    });
    ASSERT_EQ(response.http_status, 200);
    const auto& execution = response.body["result"]["execution_results"];
    EXPECT_FALSE(execution["success"].get<bool>());
    EXPECT_NE(execution["stderr"].get<std::string>().find("ValueError"), std::string::npos);
}

TEST_F(TaskProcessorTest, GeneratesAnalysisScriptFromVariables) {
    if (!PythonHasModules("numpy")) {
        GTEST_SKIP() << "numpy is required";
    }
    const auto response = processor_->Process({
        {"task_name", "Quarterly review"},
        {"variables", {{"revenue", 10}, {"cost", 4}, {"margin", 6}}}
    });
    ASSERT_EQ(response.http_status, 200) << response.body.dump();
    const auto& result = response.body["result"];
    EXPECT_EQ(result["template"], "analysis");
    EXPECT_TRUE(result["script_generated"].is_string());
    const auto& execution = result["execution_results"];
    ASSERT_TRUE(execution["success"].get<bool>()) << execution.dump();
    EXPECT_NE(execution["stdout"].get<std::string>().find("Data points analyzed: 3"), std::string::npos);
}

}  // namespace scriptbox::test
