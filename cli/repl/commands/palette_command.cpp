#include "palette_command.h"

#include <iostream>
#include <sstream>
#include <utility>

namespace csvhue::cli {

CommandHandler make_palette_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".palette")) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string value;
    iss >> cmd >> value;
    if (value != "standard" && value != "lighter") {
      std::cerr << "Usage: .palette standard|lighter" << std::endl;
      return true;
    }
    PaletteConfig palette = ctx.config.palette;
    palette.use_lighter_palette = value == "lighter";
    ctx.session.mode.set_palette(palette);
    ctx.config.palette = std::move(palette);
    std::cout << "Palette: " << value << std::endl;
    return true;
  };
}

}  // namespace csvhue::cli
