#pragma once

#include "inferguard/common/result.hpp"
#include "inferguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace inferguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parses TOML text into a Config. Missing keys keep their defaults.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Loads the config file (or defaults when it does not exist) and applies env overrides.
[[nodiscard]] common::Result<Config> load_config();

[[nodiscard]] std::string render_config(const Config &config);

/// Fails with every hard problem joined by "; ". On success returns soft warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace inferguard::config
