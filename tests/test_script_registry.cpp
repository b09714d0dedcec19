#include <gtest/gtest.h>

#include <cstdlib>
#include <limits>

#include "registry/script_registry.hpp"
#include "test_support.hpp"

#ifndef SCRIPTBOX_TEST_DATA_DIR
#define SCRIPTBOX_TEST_DATA_DIR "scripts"
#endif

namespace scriptbox::test {

using registry::ScriptRegistry;
using sandbox::ErrorKind;

class ScriptRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = MakeTestConfig(temp_.Path());
        config_.registry.base_dir = data_dir_.string();
        executor_ = std::make_unique<sandbox::SandboxExecutor>(sandbox::MakeSandboxOptions(config_.sandbox));
        registry_ = std::make_unique<ScriptRegistry>(config_, *executor_);
        ASSERT_TRUE(registry_->LoadCatalog(data_dir_ / "scripts_registry.json"));
    }

    const std::filesystem::path data_dir_{SCRIPTBOX_TEST_DATA_DIR};
    TempDir temp_;
    config::Config config_;
    std::unique_ptr<sandbox::SandboxExecutor> executor_;
    std::unique_ptr<ScriptRegistry> registry_;
};

TEST_F(ScriptRegistryTest, LoadsShippedCatalog) {
    EXPECT_EQ(registry_->Size(), 3u);
    EXPECT_TRUE(registry_->Get("adder").has_value());
    EXPECT_FALSE(registry_->Get("nope").has_value());
    EXPECT_EQ(registry_->CatalogPath(), data_dir_ / "scripts_registry.json");
}

TEST_F(ScriptRegistryTest, ListFiltersByCategoryAndSourceType) {
    EXPECT_EQ(registry_->List().size(), 3u);
    EXPECT_EQ(registry_->List("arithmetic").size(), 2u);
    EXPECT_EQ(registry_->List("", "inline").size(), 1u);
    EXPECT_EQ(registry_->List("arithmetic", "local_file").size(), 1u);
    EXPECT_TRUE(registry_->List("astrology").empty());
}

TEST_F(ScriptRegistryTest, SchemaOfKnownAndUnknownScripts) {
    const auto schema = registry_->GetSchema("adder");
    EXPECT_EQ(schema["script_id"], "adder");
    EXPECT_EQ(schema["input_schema"]["required"][0], "item1");
    EXPECT_EQ(schema["llm_template_instructions"]["example"]["item1"], 15);

    EXPECT_EQ(registry_->GetSchema("ghost")["error"], "Script ghost not found");
}

TEST_F(ScriptRegistryTest, ValidateInputAgainstCatalogSchema) {
    EXPECT_TRUE(registry_->ValidateInput("adder", {{"item1", 1}, {"item2", 2}}).valid);
    const auto bad = registry_->ValidateInput("adder", {{"item1", "one"}});
    EXPECT_FALSE(bad.valid);
    EXPECT_EQ(bad.errors.size(), 2u);
    EXPECT_EQ(registry_->ValidateInput("ghost", nlohmann::json::object()).errors[0], "Script ghost not found");
}

TEST_F(ScriptRegistryTest, StatisticsCountByDimension) {
    const auto stats = registry_->Statistics();
    EXPECT_EQ(stats["total_scripts"], 3);
    EXPECT_EQ(stats["categories"]["arithmetic"], 2);
    EXPECT_EQ(stats["categories"]["statistics"], 1);
    EXPECT_EQ(stats["source_types"]["local_file"], 2);
    EXPECT_EQ(stats["source_types"]["inline"], 1);
    EXPECT_EQ(stats["execution_types"]["python"], 3);
    EXPECT_TRUE(stats.contains("last_loaded"));
}

TEST_F(ScriptRegistryTest, UnknownScriptIsValidationError) {
    const auto outcome = registry_->Execute("ghost", nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kValidation);
    EXPECT_EQ(outcome.error, "Script ghost not found");
}

TEST_F(ScriptRegistryTest, InvalidInputNeverReachesLoader) {
    const auto outcome = registry_->Execute("adder", {{"item1", 15}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "Input validation failed");
    ASSERT_EQ(outcome.validation_errors.size(), 1u);
    EXPECT_EQ(outcome.validation_errors[0], "Missing required field: item2");
}

TEST_F(ScriptRegistryTest, UnsupportedSourceType) {
    registry_->LoadFromJson({{"odd", {{"source_type", "ftp"}, {"source_location", "ftp://x"}}}});
    const auto outcome = registry_->Execute("odd", nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "Unsupported source type: ftp");
}

TEST_F(ScriptRegistryTest, MalformedEntriesAreSkipped) {
    registry_->LoadFromJson({{"good", {{"source_type", "inline"}}}, {"bad", 42}});
    EXPECT_EQ(registry_->Size(), 1u);
}

TEST_F(ScriptRegistryTest, MistypedFieldsFallBackToDefaults) {
    const auto path = temp_.Write("catalog.json", R"({
        "odd": {"name": 5, "category": ["x"], "source_type": "inline",
                "source_location": null, "metadata": {"complexity": 3},
                "timeout": 1e300}
    })");
    ASSERT_TRUE(registry_->LoadCatalog(path));
    const auto entry = registry_->Get("odd");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "Unknown");
    EXPECT_EQ(entry->category, "general");
    EXPECT_TRUE(entry->source_location.empty());
    EXPECT_EQ(entry->timeout_s, std::numeric_limits<int>::max());
    EXPECT_EQ(registry::ToSummaryJson(*entry)["complexity"], "unknown");
    EXPECT_EQ(registry_->List().size(), 1u);
}

TEST_F(ScriptRegistryTest, RelativeBaseDirResolvesAgainstStartupDirectory) {
    if (!HasExecutable("python3")) {
        GTEST_SKIP() << "python3 is not available";
    }
    const auto absolute_data = std::filesystem::absolute(data_dir_);
    ScopedCurrentPath cwd(absolute_data.parent_path());
    config_.registry.base_dir = absolute_data.filename().string();
    ScriptRegistry registry(config_, *executor_);
    ASSERT_TRUE(registry.LoadCatalog(absolute_data.filename() / "scripts_registry.json"));

    const auto outcome = registry.Execute("adder", {{"item1", 2}, {"item2", 3}});
    ASSERT_TRUE(outcome.success) << outcome.error << outcome.stderr_text;
    EXPECT_EQ(outcome.result["result"], 5);
}

TEST_F(ScriptRegistryTest, MissingCatalogLeavesEmptyRegistry) {
    EXPECT_FALSE(registry_->LoadCatalog(temp_.Path() / "missing.json"));
    EXPECT_EQ(registry_->Size(), 0u);
    const auto broken = temp_.Write("broken.json", "{ not json");
    EXPECT_FALSE(registry_->LoadCatalog(broken));
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(ScriptRegistryTest, ReloadPicksUpCatalogChanges) {
    const auto path = temp_.Write("catalog.json", R"({"one": {"source_type": "inline"}})");
    ASSERT_TRUE(registry_->LoadCatalog(path));
    EXPECT_EQ(registry_->Size(), 1u);
    temp_.Write("catalog.json", R"({"one": {"source_type": "inline"}, "two": {"source_type": "inline"}})");
    ASSERT_TRUE(registry_->Reload());
    EXPECT_EQ(registry_->Size(), 2u);
}

TEST_F(ScriptRegistryTest, MissingLocalFileIsSourceFetchError) {
    registry_->LoadFromJson({{"lost", {{"source_type", "local_file"}, {"source_location", "nowhere/lost.py"}}}});
    const auto outcome = registry_->Execute("lost", nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kSourceFetch);
    EXPECT_EQ(outcome.error.rfind("Script file not found: ", 0), 0u);
    EXPECT_EQ(outcome.execution_metadata["source_type"], "local_file");
}

TEST_F(ScriptRegistryTest, EmptyInlineContentIsValidationError) {
    registry_->LoadFromJson({{"blank", {{"source_type", "direct_content"}}}});
    const auto outcome = registry_->Execute("blank", nlohmann::json::object());
    EXPECT_EQ(outcome.error_kind, ErrorKind::kValidation);
    EXPECT_EQ(outcome.error, "No script content provided");
}

TEST_F(ScriptRegistryTest, RunsLocalFileScript) {
    if (!HasExecutable("python3")) {
        GTEST_SKIP() << "python3 is not available";
    }
    const auto outcome = registry_->Execute("adder", {
        {"item1", 15}, {"item2", 25},
        {"context_metadata", {{"service_task_name", "Add Numbers"}}}
    });
    ASSERT_TRUE(outcome.success) << outcome.error << outcome.stderr_text;
    EXPECT_EQ(outcome.result["result"], 40);
    EXPECT_EQ(outcome.result["operation"], "addition");
    EXPECT_EQ(outcome.result["service_task_name"], "Add Numbers");
    EXPECT_EQ(outcome.result["status"], "success");
    EXPECT_EQ(outcome.execution_metadata["source_type"], "local_file");
    EXPECT_TRUE(outcome.execution_metadata.contains("duration"));
}

TEST_F(ScriptRegistryTest, RunsInlineScript) {
    if (!HasExecutable("python3")) {
        GTEST_SKIP() << "python3 is not available";
    }
    const auto outcome = registry_->Execute("square", {{"x", 7}});
    ASSERT_TRUE(outcome.success) << outcome.error << outcome.stderr_text;
    EXPECT_EQ(outcome.result["square"], 49);
}

TEST_F(ScriptRegistryTest, RunsStatisticsScript) {
    if (!HasExecutable("python3")) {
        GTEST_SKIP() << "python3 is not available";
    }
    const auto outcome = registry_->Execute("describe", {{"values", {1, 2, 3, 4}}});
    ASSERT_TRUE(outcome.success) << outcome.error << outcome.stderr_text;
    EXPECT_EQ(outcome.result["count"], 4);
    EXPECT_DOUBLE_EQ(outcome.result["mean"].get<double>(), 2.5);
}

class GitSourceTest : public ScriptRegistryTest {
protected:
    void SetUp() override {
        if (!HasExecutable("git") || !HasExecutable("python3")) {
            GTEST_SKIP() << "git and python3 are required";
        }
        ScriptRegistryTest::SetUp();
    }

    // A one-commit repository holding tools/triple.py.
    std::string MakeRepository() const {
        const auto repo = temp_.Path() / "origin";
        temp_.Write("origin/tools/triple.py", "def execute(data):\n    return {'tripled': data['n'] * 3}\n");
        const std::string command =
            "cd '" + repo.string() + "' && git init -q . && git add . && "
            "git -c user.name=scriptbox -c user.email=scriptbox@localhost commit -q -m init";
        if (std::system((command + " >/dev/null 2>&1").c_str()) != 0) {
            return {};
        }
        return "file://" + repo.string();
    }
};

TEST_F(GitSourceTest, ClonesAndRunsScript) {
    const auto url = MakeRepository();
    ASSERT_FALSE(url.empty());
    registry_->LoadFromJson({{"triple", {
        {"source_type", "git_repository"}, {"source_location", url}, {"source_path", "tools/triple.py"}
    }}});
    const auto outcome = registry_->Execute("triple", {{"n", 5}});
    ASSERT_TRUE(outcome.success) << outcome.error << outcome.stderr_text;
    EXPECT_EQ(outcome.result["tripled"], 15);
    EXPECT_EQ(outcome.result["git_repository"], url);
    EXPECT_EQ(outcome.execution_metadata["git_repository"], url);
    EXPECT_TRUE(DirectoryIsEmpty(config_.sandbox.temp_root));
}

TEST_F(GitSourceTest, RejectsPathOutsideRepository) {
    const auto url = MakeRepository();
    ASSERT_FALSE(url.empty());
    registry_->LoadFromJson({{"escape", {
        {"source_type", "git_repository"}, {"source_location", url}, {"source_path", "../../etc/passwd"}
    }}});
    const auto outcome = registry_->Execute("escape", nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kSourceFetch);
    EXPECT_EQ(outcome.error, "Script not found in repository: ../../etc/passwd");
}

TEST_F(GitSourceTest, UnreachableRepositoryIsCloneFailure) {
    registry_->LoadFromJson({{"far", {
        {"source_type", "git_repository"},
        {"source_location", (temp_.Path() / "no_such_repo").string()},
        {"source_path", "x.py"}
    }}});
    const auto outcome = registry_->Execute("far", nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kSourceFetch);
    EXPECT_EQ(outcome.error.rfind("Git clone failed: ", 0), 0u);
}

}  // namespace scriptbox::test
