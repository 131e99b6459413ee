#include "cli_args.h"

#include <stdexcept>
#include <string>

#include "cli_utils.h"

namespace csvhue::cli {

void print_startup_help(std::ostream& os) {
  os << "csvhue - rainbow column highlighting for CSV\n\n";
  os << "Usage:\n";
  os << "  csvhue --input <path|url> [--lines A:B]\n";
  os << "  csvhue --interactive [--input <path|url>]\n";
  os << "  csvhue --mode ansi|json|plain\n";
  os << "  csvhue --palette standard|lighter\n";
  os << "  csvhue --highlight on|off\n";
  os << "  csvhue --config <path>\n";
  os << "  csvhue --timeout-ms <n>\n";
  os << "  csvhue --color=disabled\n\n";
  os << "Notes:\n";
  os << "  - If --input is omitted, CSV is read from stdin.\n";
  os << "  - http:// and https:// inputs are fetched with libcurl.\n";
  os << "  - --lines is 1-based and inclusive; only those lines are highlighted.\n\n";
  os << "Examples:\n";
  os << "  csvhue --input ./data/people.csv --lines 1:40\n";
  os << "  csvhue --input ./data/people.csv --mode json --lines 2:2\n";
  os << "  csvhue --interactive --input ./data/people.csv\n";
}

void print_help(std::ostream& os) {
  os << "Usage: csvhue [--input <path|url>] [--lines A:B] [--line-numbers]\n";
  os << "       csvhue --interactive [--input <path|url>]\n";
  os << "       csvhue --mode ansi|json|plain\n";
  os << "       csvhue --palette standard|lighter\n";
  os << "       csvhue --highlight on|off\n";
  os << "       csvhue --config <path>\n";
  os << "       csvhue --timeout-ms <n>\n";
  os << "       csvhue --color=disabled\n";
  os << "If --input is omitted, CSV is read from stdin.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--input" && i + 1 < argc) {
      options.input = argv[++i];
    } else if (arg == "--lines" && i + 1 < argc) {
      options.lines = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--interactive") {
      options.interactive = true;
    } else if (arg == "--line-numbers") {
      options.line_numbers = true;
    } else if (arg == "--mode" && i + 1 < argc) {
      std::string value = argv[++i];
      if (!is_output_mode(value)) {
        error = "Invalid --mode value (use " + output_mode_usage() + ")";
        return false;
      }
      options.output_mode = value;
    } else if (arg == "--palette" && i + 1 < argc) {
      std::string value = argv[++i];
      if (value == "lighter") {
        options.use_lighter_palette = true;
      } else if (value == "standard") {
        options.use_lighter_palette = false;
      } else {
        error = "Invalid --palette value (use standard|lighter)";
        return false;
      }
    } else if (arg == "--highlight" && i + 1 < argc) {
      std::string value = argv[++i];
      if (value == "on") {
        options.highlight = true;
      } else if (value == "off") {
        options.highlight = false;
      } else {
        error = "Invalid --highlight value (use on|off)";
        return false;
      }
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      std::string value = argv[++i];
      int parsed = 0;
      try {
        size_t pos = 0;
        parsed = std::stoi(value, &pos);
        if (pos != value.size()) parsed = 0;
      } catch (const std::exception&) {
        parsed = 0;
      }
      if (parsed <= 0) {
        error = "Invalid --timeout-ms value (use a positive number of milliseconds)";
        return false;
      }
      options.timeout_ms = parsed;
    } else if (arg == "--help") {
      options.show_help = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

}  // namespace csvhue::cli
