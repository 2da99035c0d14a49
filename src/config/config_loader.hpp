#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace codeact::config {

// Defaults, then ~/.codeact/config.json, then environment overrides.
Config LoadConfig();
// Same, reading the given file instead of the one under $HOME.
Config LoadConfig(const std::filesystem::path& path);

}  // namespace codeact::config
