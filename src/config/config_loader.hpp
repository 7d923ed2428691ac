#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace runbox::config {

Config LoadConfig();

// Loads from an explicit file, skipping the home-directory lookup. Environment
// overrides still apply.
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace runbox::config
