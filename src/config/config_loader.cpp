#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace scriptbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

void ApplyDerivedDefaults(Config& config, const std::filesystem::path& config_path) {
    if (config.sandbox.temp_root.empty()) {
        std::error_code ec;
        auto root = std::filesystem::temp_directory_path(ec);
        if (ec) {
            root = "/tmp";
        }
        config.sandbox.temp_root = (root / "scriptbox").string();
    }
    if (config.registry.catalog_path.empty()) {
        config.registry.catalog_path = (config_path.parent_path() / "scripts_registry.json").string();
    }
    if (config.registry.base_dir.empty()) {
        config.registry.base_dir = std::filesystem::path(config.registry.catalog_path).parent_path().string();
    }
    if (config.sandbox.max_timeout_s < config.sandbox.default_timeout_s) {
        config.sandbox.max_timeout_s = config.sandbox.default_timeout_s;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto override_path = GetEnv("SCRIPTBOX_CONFIG_FILE");
    if (!override_path.empty()) {
        return override_path;
    }
    return GetHomePath() / ".scriptbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadBool(sandbox, "enabled", config.sandbox.enabled);
        ReadString(sandbox, "tempRoot", config.sandbox.temp_root);
        ReadInt(sandbox, "defaultTimeoutS", config.sandbox.default_timeout_s);
        ReadInt(sandbox, "maxTimeoutS", config.sandbox.max_timeout_s);
        ReadInt(sandbox, "memoryLimitMb", config.sandbox.memory_limit_mb);
        ReadBool(sandbox, "isolateNetwork", config.sandbox.isolate_network);
        if (sandbox.contains("maxOutputBytes") && sandbox["maxOutputBytes"].is_number_integer()) {
            config.sandbox.max_output_bytes = sandbox["maxOutputBytes"].get<long long>();
        }
        if (sandbox.contains("envAllowList") && sandbox["envAllowList"].is_array()) {
            config.sandbox.env_allow_list.clear();
            for (const auto& item : sandbox["envAllowList"]) {
                if (item.is_string()) {
                    config.sandbox.env_allow_list.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (data.contains("interpreters") && data["interpreters"].is_object()) {
        const auto& interpreters = data["interpreters"];
        ReadString(interpreters, "python", config.interpreters.python);
        ReadString(interpreters, "rscript", config.interpreters.rscript);
        ReadString(interpreters, "scilab", config.interpreters.scilab);
        ReadString(interpreters, "git", config.interpreters.git);
    }

    if (data.contains("registry") && data["registry"].is_object()) {
        const auto& registry = data["registry"];
        ReadString(registry, "catalogPath", config.registry.catalog_path);
        ReadString(registry, "baseDir", config.registry.base_dir);
        ReadInt(registry, "remoteTimeoutS", config.registry.remote_timeout_s);
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto sandbox_enabled = GetEnvFallback("SCRIPTBOX_SANDBOX__ENABLED", "SANDBOX_MODE");
    if (!sandbox_enabled.empty()) {
        config.sandbox.enabled = ParseBool(sandbox_enabled);
    }

    const auto temp_root = GetEnv("SCRIPTBOX_SANDBOX__TEMP_ROOT");
    if (!temp_root.empty()) {
        config.sandbox.temp_root = temp_root;
    }

    const auto default_timeout = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__DEFAULT_TIMEOUT_S",
        "EXECUTION_TIMEOUT");
    if (!default_timeout.empty()) {
        config.sandbox.default_timeout_s = ParseInt(default_timeout, config.sandbox.default_timeout_s);
    }

    const auto max_timeout = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__MAX_TIMEOUT_S",
        "MAX_EXECUTION_TIME");
    if (!max_timeout.empty()) {
        config.sandbox.max_timeout_s = ParseInt(max_timeout, config.sandbox.max_timeout_s);
    }

    const auto memory_limit = GetEnv("SCRIPTBOX_SANDBOX__MEMORY_LIMIT_MB");
    if (!memory_limit.empty()) {
        config.sandbox.memory_limit_mb = ParseInt(memory_limit, config.sandbox.memory_limit_mb);
    }

    const auto isolate_network = GetEnv("SCRIPTBOX_SANDBOX__ISOLATE_NETWORK");
    if (!isolate_network.empty()) {
        config.sandbox.isolate_network = ParseBool(isolate_network);
    }

    const auto allow_list = GetEnv("SCRIPTBOX_SANDBOX__ENV_ALLOW_LIST");
    if (!allow_list.empty()) {
        config.sandbox.env_allow_list = SplitCsv(allow_list);
    }

    const auto python = GetEnvFallback("SCRIPTBOX_INTERPRETERS__PYTHON", "PYTHON_PATH");
    if (!python.empty()) {
        config.interpreters.python = python;
    }

    const auto rscript = GetEnvFallback("SCRIPTBOX_INTERPRETERS__RSCRIPT", "R_PATH");
    if (!rscript.empty()) {
        config.interpreters.rscript = rscript;
    }

    const auto scilab = GetEnvFallback("SCRIPTBOX_INTERPRETERS__SCILAB", "SCILAB_PATH");
    if (!scilab.empty()) {
        config.interpreters.scilab = scilab;
    }

    const auto git = GetEnv("SCRIPTBOX_INTERPRETERS__GIT");
    if (!git.empty()) {
        config.interpreters.git = git;
    }

    const auto catalog_path = GetEnv("SCRIPTBOX_REGISTRY__CATALOG_PATH");
    if (!catalog_path.empty()) {
        config.registry.catalog_path = catalog_path;
    }

    const auto base_dir = GetEnv("SCRIPTBOX_REGISTRY__BASE_DIR");
    if (!base_dir.empty()) {
        config.registry.base_dir = base_dir;
    }

    const auto remote_timeout = GetEnv("SCRIPTBOX_REGISTRY__REMOTE_TIMEOUT_S");
    if (!remote_timeout.empty()) {
        config.registry.remote_timeout_s = ParseInt(remote_timeout, config.registry.remote_timeout_s);
    }

    const auto host = GetEnvFallback("SCRIPTBOX_SERVER__HOST", "SERVICE_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("SCRIPTBOX_SERVER__PORT", "PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto log_level = GetEnv("SCRIPTBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::Log(utils::LogLevel::kWarn, "config", "invalid config file, keeping defaults",
                       {{"path", config_path.string()}});
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyConfigFromEnv(config);
    ApplyDerivedDefaults(config, config_path);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace scriptbox::config
