#pragma once

#include <istream>
#include <string>

#include "csvhue/palette.h"

namespace csvhue::cli {

/// Carries runtime settings that can be mutated during a session.
/// MUST keep fields synchronized with CLI flags and the configuration file.
/// Inputs are from CLI parsing and config; outputs affect rendering and highlighting.
struct ReplConfig {
  std::string input;
  std::string config_path;
  bool color = true;
  bool highlight = true;
  bool line_numbers = false;
  std::string output_mode = "ansi";
  int timeout_ms = 5000;
  PaletteConfig palette = default_palette_config();
};

/// Runs the interactive loop over `in` and returns an exit status.
/// MUST not throw on normal user exits and MUST report command errors on stderr.
int run_repl(ReplConfig& config, std::istream& in);

}  // namespace csvhue::cli
