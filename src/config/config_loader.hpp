#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace scriptbox::config {

std::filesystem::path GetConfigPath();

// Defaults, then the JSON file, then environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace scriptbox::config
