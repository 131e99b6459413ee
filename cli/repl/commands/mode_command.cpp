#include "mode_command.h"

#include <iostream>
#include <sstream>

#include "cli_utils.h"

namespace csvhue::cli {

CommandHandler make_mode_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".mode")) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string mode;
    std::string extra;
    iss >> cmd >> mode >> extra;
    if (mode.empty()) {
      std::cout << "Output mode: " << ctx.config.output_mode << " (available: "
                << output_mode_usage() << ")" << std::endl;
      return true;
    }
    if (!extra.empty() || !is_output_mode(mode)) {
      std::cerr << "Usage: .mode " << output_mode_usage() << std::endl;
      return true;
    }
    ctx.config.output_mode = mode;
    std::cout << "Output mode: " << mode;
    if (mode == "ansi" && !ctx.config.color) {
      std::cout << " (color disabled, columns print uncolored)";
    }
    std::cout << std::endl;
    return true;
  };
}

}  // namespace csvhue::cli
