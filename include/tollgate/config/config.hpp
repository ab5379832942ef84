#pragma once

#include "tollgate/common/result.hpp"
#include "tollgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace tollgate::config {

[[nodiscard]] common::Result<std::filesystem::path> home_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_path(std::string value);

/// Parse TOML text on top of the built-in defaults. No environment overrides are applied.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
/// load_config followed by validate_config; warnings are dropped, errors fail the load.
[[nodiscard]] common::Result<Config> load_validated_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] common::Status save_config_to(const Config &config,
                                            const std::filesystem::path &path);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tollgate::config
