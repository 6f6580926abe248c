#pragma once

#include "matrixnotify/common/result.hpp"
#include "matrixnotify/common/toml.hpp"
#include "matrixnotify/config/schema.hpp"

#include <filesystem>
#include <optional>

namespace matrixnotify::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Reads the config file if present, then applies MATRIX_NOTIFY_* environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Applies values from an already parsed document on top of `config`.
void apply_document(const common::TomlDocument &doc, Config &config);
void apply_env_overrides(Config &config);

} // namespace matrixnotify::config
