#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace csvhue::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// Unset optionals leave the configuration file value in place.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string input;
  std::string lines;
  std::string config_path;
  bool interactive = false;
  bool color = true;
  bool line_numbers = false;
  std::optional<std::string> output_mode;
  std::optional<bool> highlight;
  std::optional<bool> use_lighter_palette;
  int timeout_ms = 5000;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on invalid flag values.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace csvhue::cli
