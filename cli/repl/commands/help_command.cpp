#include "help_command.h"

#include <iostream>

namespace csvhue::cli {

CommandHandler make_help_command() {
  return [](const std::string& line, CommandContext&) -> bool {
    if (!matches_command(line, ".help") && !matches_command(line, ":help")) {
      return false;
    }
    std::cout << "Commands:\n";
    std::cout << "  .help                      Show this help\n";
    std::cout << "  .load <path|url>           Load a CSV document\n";
    std::cout << "  .show [A:B]                Highlight and print lines A..B\n";
    std::cout << "  .set <n> <text>            Replace line n\n";
    std::cout << "  .insert <n> <text>         Insert a line before line n\n";
    std::cout << "  .delete <n>                Delete line n\n";
    std::cout << "  .highlight on|off          Enable or disable column colors\n";
    std::cout << "  .palette standard|lighter  Select the active palette\n";
    std::cout << "  .mode ansi|json|plain      Set output mode\n";
    std::cout << "  .reload_config             Re-read the configuration file\n";
    std::cout << "  .quit / .q                 Exit\n";
    return true;
  };
}

}  // namespace csvhue::cli
