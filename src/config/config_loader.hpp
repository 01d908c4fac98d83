#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"

namespace kalibox::config {

std::filesystem::path GetConfigPath();

// Defaults, then ~/.kalibox/config.json, then KALIBOX_* environment variables.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);
// Raises readiness backoffs to at least 1 ms and the cap to at least the initial value.
void ClampReadiness(SandboxConfig& sandbox);

HostKeyPolicy ParseHostKeyPolicy(const std::string& value, HostKeyPolicy fallback);
std::string ToString(HostKeyPolicy policy);

}  // namespace kalibox::config
