#pragma once

#include "cligate/common/result.hpp"
#include "cligate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cligate::config {

/// Default location: $CLIGATE_CONFIG_PATH, else ~/.cligate/config.toml.
[[nodiscard]] common::Result<std::filesystem::path> default_config_path();

/// Load from `path` (or the default path). A missing file yields defaults with
/// environment overrides applied.
[[nodiscard]] common::Result<Config>
load_config(const std::optional<std::filesystem::path> &path = std::nullopt);

/// Parse TOML text into a Config without touching the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

void apply_env_overrides(Config &config);

/// Effective configuration as TOML text that parse_config reads back.
[[nodiscard]] std::string render_config(const Config &config);

/// Returns warnings on success; hard errors are Configuration failures.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace cligate::config
