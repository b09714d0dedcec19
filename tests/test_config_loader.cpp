#include <gtest/gtest.h>

#include <cstdlib>

#include "config/config_loader.hpp"
#include "test_support.hpp"
#include "utils/logging.hpp"

namespace scriptbox::test {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto* name : kVariables) {
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        for (const auto* name : kVariables) {
            ::unsetenv(name);
        }
    }

    static constexpr const char* kVariables[] = {
        "SCRIPTBOX_SANDBOX__ENABLED", "SANDBOX_MODE",
        "SCRIPTBOX_SANDBOX__TEMP_ROOT",
        "SCRIPTBOX_SANDBOX__DEFAULT_TIMEOUT_S", "EXECUTION_TIMEOUT",
        "SCRIPTBOX_SANDBOX__MAX_TIMEOUT_S", "MAX_EXECUTION_TIME",
        "SCRIPTBOX_SANDBOX__MEMORY_LIMIT_MB", "SCRIPTBOX_SANDBOX__ISOLATE_NETWORK",
        "SCRIPTBOX_SANDBOX__ENV_ALLOW_LIST",
        "SCRIPTBOX_INTERPRETERS__PYTHON", "PYTHON_PATH",
        "SCRIPTBOX_INTERPRETERS__RSCRIPT", "R_PATH",
        "SCRIPTBOX_INTERPRETERS__SCILAB", "SCILAB_PATH",
        "SCRIPTBOX_INTERPRETERS__GIT",
        "SCRIPTBOX_REGISTRY__CATALOG_PATH", "SCRIPTBOX_REGISTRY__BASE_DIR",
        "SCRIPTBOX_REGISTRY__REMOTE_TIMEOUT_S",
        "SCRIPTBOX_SERVER__HOST", "SERVICE_HOST",
        "SCRIPTBOX_SERVER__PORT", "PORT",
        "SCRIPTBOX_LOG_LEVEL"
    };

    TempDir temp_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFile) {
    const auto config = config::LoadConfig(temp_.Path() / "absent.json");
    EXPECT_TRUE(config.sandbox.enabled);
    EXPECT_EQ(config.sandbox.default_timeout_s, 30);
    EXPECT_EQ(config.sandbox.max_timeout_s, 300);
    EXPECT_EQ(config.interpreters.python, "python3");
    EXPECT_EQ(config.server.port, 5203);
    EXPECT_FALSE(config.sandbox.temp_root.empty());
    EXPECT_EQ(config.registry.catalog_path, (temp_.Path() / "scripts_registry.json").string());
    EXPECT_EQ(config.registry.base_dir, temp_.Path().string());
}

TEST_F(ConfigLoaderTest, ReadsJsonFile) {
    const auto path = temp_.Write("config.json", R"({
        "sandbox": {"enabled": false, "defaultTimeoutS": 12, "maxTimeoutS": 40,
                    "memoryLimitMb": 512, "envAllowList": ["PATH"]},
        "interpreters": {"python": "/opt/python/bin/python3", "git": "/usr/local/bin/git"},
        "registry": {"catalogPath": "/srv/catalog.json", "remoteTimeoutS": 15},
        "server": {"host": "127.0.0.1", "port": 9000},
        "logging": {"level": "debug"}
    })");
    const auto config = config::LoadConfig(path);
    EXPECT_FALSE(config.sandbox.enabled);
    EXPECT_EQ(config.sandbox.default_timeout_s, 12);
    EXPECT_EQ(config.sandbox.max_timeout_s, 40);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 512);
    EXPECT_EQ(config.sandbox.env_allow_list, std::vector<std::string>{"PATH"});
    EXPECT_EQ(config.interpreters.python, "/opt/python/bin/python3");
    EXPECT_EQ(config.interpreters.git, "/usr/local/bin/git");
    EXPECT_EQ(config.registry.catalog_path, "/srv/catalog.json");
    EXPECT_EQ(config.registry.base_dir, "/srv");
    EXPECT_EQ(config.registry.remote_timeout_s, 15);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, InvalidJsonKeepsDefaults) {
    const auto path = temp_.Write("config.json", "{ sandbox: nope");
    const auto config = config::LoadConfig(path);
    EXPECT_TRUE(config.sandbox.enabled);
    EXPECT_EQ(config.sandbox.default_timeout_s, 30);
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    const auto path = temp_.Write("config.json", R"({"server": {"port": "eighty"}, "sandbox": []})");
    const auto config = config::LoadConfig(path);
    EXPECT_EQ(config.server.port, 5203);
    EXPECT_TRUE(config.sandbox.enabled);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = temp_.Write("config.json", R"({"server": {"port": 9000}, "sandbox": {"enabled": true}})");
    ::setenv("SCRIPTBOX_SERVER__PORT", "7000", 1);
    ::setenv("SANDBOX_MODE", "false", 1);
    ::setenv("EXECUTION_TIMEOUT", "45", 1);
    ::setenv("MAX_EXECUTION_TIME", "90", 1);
    ::setenv("R_PATH", "/opt/R/bin/Rscript", 1);
    ::setenv("SCRIPTBOX_SANDBOX__ENV_ALLOW_LIST", "PATH,LANG", 1);
    const auto config = config::LoadConfig(path);
    EXPECT_EQ(config.server.port, 7000);
    EXPECT_FALSE(config.sandbox.enabled);
    EXPECT_EQ(config.sandbox.default_timeout_s, 45);
    EXPECT_EQ(config.sandbox.max_timeout_s, 90);
    EXPECT_EQ(config.interpreters.rscript, "/opt/R/bin/Rscript");
    const std::vector<std::string> allow = {"PATH", "LANG"};
    EXPECT_EQ(config.sandbox.env_allow_list, allow);
}

TEST_F(ConfigLoaderTest, PrefixedVariableBeatsLegacyName) {
    ::setenv("SCRIPTBOX_SERVER__PORT", "7001", 1);
    ::setenv("PORT", "7002", 1);
    EXPECT_EQ(config::LoadConfig(temp_.Path() / "absent.json").server.port, 7001);
}

TEST_F(ConfigLoaderTest, UnparsableNumberKeepsPreviousValue) {
    ::setenv("EXECUTION_TIMEOUT", "soon", 1);
    EXPECT_EQ(config::LoadConfig(temp_.Path() / "absent.json").sandbox.default_timeout_s, 30);
}

TEST_F(ConfigLoaderTest, MaxTimeoutNeverBelowDefault) {
    ::setenv("EXECUTION_TIMEOUT", "500", 1);
    const auto config = config::LoadConfig(temp_.Path() / "absent.json");
    EXPECT_EQ(config.sandbox.default_timeout_s, 500);
    EXPECT_EQ(config.sandbox.max_timeout_s, 500);
}

TEST_F(ConfigLoaderTest, ConfigPathOverride) {
    ::setenv("SCRIPTBOX_CONFIG_FILE", "/etc/scriptbox/config.json", 1);
    EXPECT_EQ(config::GetConfigPath(), std::filesystem::path("/etc/scriptbox/config.json"));
    ::unsetenv("SCRIPTBOX_CONFIG_FILE");
}

TEST(LogLevelTest, ParsesConfiguredNames) {
    EXPECT_EQ(utils::ParseLogLevel("DEBUG"), utils::LogLevel::kDebug);
    EXPECT_EQ(utils::ParseLogLevel("warning"), utils::LogLevel::kWarn);
    EXPECT_EQ(utils::ParseLogLevel("error"), utils::LogLevel::kError);
    EXPECT_EQ(utils::ParseLogLevel("loud", utils::LogLevel::kWarn), utils::LogLevel::kWarn);
}

TEST(LogLevelTest, ConfigRoundTrips) {
    const auto previous = utils::GetLogConfig();
    utils::LogConfig config{};
    config.min_level = utils::LogLevel::kError;
    utils::SetLogConfig(config);
    EXPECT_EQ(utils::GetLogConfig().min_level, utils::LogLevel::kError);
    utils::SetLogConfig(previous);
}

}  // namespace scriptbox::test
