#include "highlight_command.h"

#include <iostream>
#include <sstream>

namespace csvhue::cli {

CommandHandler make_highlight_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".highlight")) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string value;
    iss >> cmd >> value;
    if (value == "on") {
      ctx.session.mode.enable();
      ctx.config.highlight = true;
      std::cout << "Highlight: on" << std::endl;
    } else if (value == "off") {
      ctx.session.mode.disable();
      ctx.config.highlight = false;
      std::cout << "Highlight: off" << std::endl;
    } else {
      std::cerr << "Usage: .highlight on|off" << std::endl;
    }
    return true;
  };
}

}  // namespace csvhue::cli
