#include "repl.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include "cli_utils.h"
#include "repl/commands/registry.h"
#include "session.h"
#include "ui/color.h"
#include "util/string_util.h"

namespace csvhue::cli {

int run_repl(ReplConfig& config, std::istream& in) {
  Session session(config.palette);
  session.driver.set_warning_handler([&config](const std::string& message) {
    if (config.color) std::cerr << kColor.yellow;
    std::cerr << "Warning: " << message << std::endl;
    if (config.color) std::cerr << kColor.reset;
  });
  if (!config.input.empty()) {
    try {
      session.load(load_csv_input(config.input, config.timeout_ms), config.input, config.highlight);
      std::cout << "Loaded " << session.document.line_count() << " line(s) from "
                << config.input << std::endl;
    } catch (const std::exception& ex) {
      if (config.color) std::cerr << kColor.red;
      std::cerr << "Error: " << ex.what() << std::endl;
      if (config.color) std::cerr << kColor.reset;
    }
  } else if (config.highlight) {
    session.mode.enable();
  }

  CommandRegistry registry;
  register_default_commands(registry);
  CommandContext ctx{config, session};

  const std::string prompt = "csvhue> ";
  std::string line;
  while (true) {
    if (config.color) {
      std::cout << kColor.blue << prompt << kColor.reset;
    } else {
      std::cout << prompt;
    }
    std::cout.flush();
    if (!std::getline(in, line)) {
      break;
    }
    std::string command = util::trim_ws(line);
    if (command.empty()) {
      continue;
    }
    if (command == ":quit" || command == ":exit" || command == ".quit" || command == ".q") {
      break;
    }
    try {
      if (!registry.try_handle(command, ctx)) {
        if (config.color) std::cerr << kColor.red;
        std::cerr << "Unknown command: " << command << std::endl;
        if (config.color) std::cerr << kColor.reset;
        if (config.color) std::cerr << kColor.yellow;
        std::cerr << "Tip: Type .help for the list of commands." << std::endl;
        if (config.color) std::cerr << kColor.reset;
      }
    } catch (const std::exception& ex) {
      if (config.color) std::cerr << kColor.red;
      std::cerr << "Error: " << ex.what() << std::endl;
      if (config.color) std::cerr << kColor.reset;
    }
  }
  return 0;
}

}  // namespace csvhue::cli
