#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codebox::config {

// Defaults, then $CODEBOX_CONFIG (or ~/.codebox/config.json), then
// CODEBOX_<SECTION>__<KEY> environment overrides.
Config LoadConfig();

Config LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

void ApplyEnvironmentOverrides(Config& config);

}  // namespace codebox::config
