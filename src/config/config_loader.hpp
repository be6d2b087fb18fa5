#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace lrunbox::config {

// ~/.lrunbox/config.json
std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file if it exists, then LRUNBOX_* environment
// variables. A broken file is reported and otherwise ignored.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace lrunbox::config
