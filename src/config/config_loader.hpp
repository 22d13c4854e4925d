#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace tooldock::config {

std::filesystem::path DefaultConfigPath();

// Reads ~/.tooldock/config.json when present, then applies TOOLDOCK_* environment overrides.
SupervisorConfig LoadConfig();
SupervisorConfig LoadConfig(const std::filesystem::path& config_path);

}  // namespace tooldock::config
