#pragma once

#include <optional>
#include <string>
#include <vector>

#include "repl/core/repl.h"

namespace csvhue::cli {

/// Settings read from the configuration file; unset keys keep built-in defaults.
struct Settings {
  std::optional<bool> use_lighter_palette;
  std::optional<std::vector<std::string>> standard_palette;
  std::optional<std::vector<std::string>> lighter_palette;
  std::optional<bool> highlight;
  std::optional<std::string> output_mode;
};

/// Resolves the configuration path from CSVHUE_CONFIG, XDG_CONFIG_HOME or HOME.
std::string resolve_config_path();
/// Loads settings from a TOML-style file.
/// MUST return false with an empty error when the file does not exist and MUST
/// report the offending key and line number on invalid values.
bool load_config(const std::string& path, Settings& out, std::string& error);
/// Applies loaded settings to the runtime configuration.
/// MUST derive the lighter palette from a configured standard palette when no
/// lighter palette is given.
bool apply_settings(const Settings& settings, ReplConfig& config, std::string& error);

}  // namespace csvhue::cli
