#include "load_command.h"

#include <iostream>
#include <sstream>
#include <utility>

#include "cli_utils.h"

namespace csvhue::cli {

CommandHandler make_load_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".load") && !matches_command(line, ":load")) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string target;
    iss >> cmd >> target;
    if (target.empty()) {
      std::cerr << "Usage: .load <path|url>" << std::endl;
      return true;
    }
    std::string text = load_csv_input(target, ctx.config.timeout_ms);
    ctx.session.load(std::move(text), target, ctx.config.highlight);
    ctx.config.input = target;
    std::cout << "Loaded " << ctx.session.document.line_count() << " line(s) from " << target
              << std::endl;
    return true;
  };
}

}  // namespace csvhue::cli
