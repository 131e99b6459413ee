#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "cli_utils.h"
#include "csvhue/palette.h"
#include "util/string_util.h"

namespace csvhue::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if (trimmed.front() == '"' || trimmed.front() == '\'') {
    if (trimmed.size() < 2 || trimmed.back() != trimmed.front()) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

/// Parses `["a", "b"]` into its string items.
/// MUST reject empty arrays and empty items.
bool parse_string_list(const std::string& raw, std::vector<std::string>& out) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  std::string inner = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
  if (inner.empty()) return false;
  if (inner.back() == ',') inner.pop_back();
  out.clear();
  for (const auto& item : util::split_trimmed(inner, ',')) {
    bool ok = false;
    std::string value = parse_string_value(item, ok);
    if (!ok || value.empty()) return false;
    out.push_back(value);
  }
  return !out.empty();
}

bool parse_palette(const std::string& raw,
                   const std::string& key,
                   size_t line_no,
                   std::vector<std::string>& out,
                   std::string& error) {
  if (!parse_string_list(raw, out)) {
    error = "Invalid " + key + " at line " + std::to_string(line_no);
    return false;
  }
  for (const auto& color : out) {
    if (!parse_color(color).has_value()) {
      error = "Invalid color '" + color + "' in " + key + " at line " + std::to_string(line_no);
      return false;
    }
  }
  return true;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("CSVHUE_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "csvhue" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "csvhue" / "config.toml").string();
  }
  return "csvhue.config.toml";
}

bool load_config(const std::string& path, Settings& out, std::string& error) {
  out = Settings{};
  if (path.empty()) return false;
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.size() >= 2 && trimmed[0] == '/' && trimmed[1] == '/') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']' && trimmed.find('=') == std::string::npos) {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    if (full_key == "palette.use_lighter") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid palette.use_lighter at line " + std::to_string(line_no);
        return false;
      }
      out.use_lighter_palette = parsed;
    } else if (full_key == "palette.standard") {
      std::vector<std::string> parsed;
      if (!parse_palette(value, full_key, line_no, parsed, error)) {
        return false;
      }
      out.standard_palette = parsed;
    } else if (full_key == "palette.lighter") {
      std::vector<std::string> parsed;
      if (!parse_palette(value, full_key, line_no, parsed, error)) {
        return false;
      }
      out.lighter_palette = parsed;
    } else if (full_key == "display.highlight") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid display.highlight at line " + std::to_string(line_no);
        return false;
      }
      out.highlight = parsed;
    } else if (full_key == "display.output_mode") {
      bool ok = false;
      std::string parsed = util::to_lower(parse_string_value(value, ok));
      if (!ok || !is_output_mode(parsed)) {
        error = "Invalid display.output_mode at line " + std::to_string(line_no);
        return false;
      }
      out.output_mode = parsed;
    }
  }
  return true;
}

bool apply_settings(const Settings& settings, ReplConfig& config, std::string& error) {
  PaletteConfig palette = config.palette;
  if (settings.standard_palette.has_value()) {
    palette.standard_palette = *settings.standard_palette;
    if (!settings.lighter_palette.has_value()) {
      try {
        palette.lighter_palette = derive_lighter_palette(palette.standard_palette);
      } catch (const std::invalid_argument& ex) {
        error = ex.what();
        return false;
      }
    }
  }
  if (settings.lighter_palette.has_value()) {
    palette.lighter_palette = *settings.lighter_palette;
  }
  if (settings.use_lighter_palette.has_value()) {
    palette.use_lighter_palette = *settings.use_lighter_palette;
  }
  config.palette = std::move(palette);
  if (settings.highlight.has_value()) {
    config.highlight = *settings.highlight;
  }
  if (settings.output_mode.has_value()) {
    config.output_mode = *settings.output_mode;
  }
  return true;
}

}  // namespace csvhue::cli
