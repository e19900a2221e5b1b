#pragma once

#include "postbox/common/result.hpp"
#include "postbox/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace postbox::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Load .env files, then the TOML config (if present), then environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Returns warnings on success; a failure means the process must not start.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Human-readable dump with the account password redacted.
[[nodiscard]] std::string describe_config(const Config &config);

} // namespace postbox::config
