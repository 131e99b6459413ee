#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>

#include "cli_args.h"
#include "cli_utils.h"
#include "repl/config.h"
#include "repl/core/repl.h"
#include "session.h"
#include "ui/color.h"

namespace {

void print_error(const std::string& message, bool color) {
  using csvhue::cli::kColor;
  if (color) std::cerr << kColor.red;
  std::cerr << "Error: " << message << std::endl;
  if (color) std::cerr << kColor.reset;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace csvhue::cli;

  if (argc == 1 && isatty(fileno(stdin))) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    print_error(error, options.color && isatty(fileno(stderr)));
    return 1;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }

  ReplConfig config;
  config.input = options.input;
  config.color = options.color;
  config.line_numbers = options.line_numbers;
  config.timeout_ms = options.timeout_ms;
  config.config_path = options.config_path.empty() ? resolve_config_path() : options.config_path;
  if (!isatty(fileno(stdout))) {
    config.color = false;
  }

  try {
    Settings settings;
    std::string config_error;
    if (load_config(config.config_path, settings, config_error)) {
      if (!apply_settings(settings, config, config_error)) {
        print_error(config_error, config.color);
        return 1;
      }
    } else if (!config_error.empty()) {
      print_error(config_error, config.color);
      return 1;
    }
    if (options.output_mode.has_value()) {
      config.output_mode = *options.output_mode;
    }
    if (options.highlight.has_value()) {
      config.highlight = *options.highlight;
    }
    if (options.use_lighter_palette.has_value()) {
      config.palette.use_lighter_palette = *options.use_lighter_palette;
    }

    if (options.interactive) {
      return run_repl(config, std::cin);
    }

    std::string text = config.input.empty() ? read_stdin()
                                            : load_csv_input(config.input, config.timeout_ms);
    Session session(config.palette);
    session.driver.set_warning_handler([&config](const std::string& message) {
      if (config.color) std::cerr << kColor.yellow;
      std::cerr << "Warning: " << message << std::endl;
      if (config.color) std::cerr << kColor.reset;
    });
    session.load(std::move(text), config.input.empty() ? "stdin" : config.input, config.highlight);
    if (session.document.empty()) {
      return 0;
    }

    LineRange range;
    if (!parse_line_range(options.lines, visible_line_count(session.document), range, error)) {
      print_error(error, config.color);
      return 1;
    }
    // Only the requested viewport is highlighted.
    session.mode.paint(line_range_region(session.document, range));
    std::cout << render_view(session, range, config.output_mode, config.color, config.line_numbers);
  } catch (const std::exception& ex) {
    print_error(ex.what(), config.color);
    return 1;
  }
  return 0;
}
