#include "reload_config_command.h"

#include <iostream>
#include <utility>

#include "repl/config.h"

namespace csvhue::cli {

CommandHandler make_reload_config_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".reload_config")) {
      return false;
    }
    std::string path = ctx.config.config_path.empty() ? resolve_config_path()
                                                      : ctx.config.config_path;
    Settings settings;
    std::string error;
    if (!load_config(path, settings, error)) {
      if (error.empty()) {
        std::cerr << "No config found at " << path << std::endl;
      } else {
        std::cerr << "Error: " << error << std::endl;
      }
      return true;
    }
    ReplConfig updated = ctx.config;
    if (!apply_settings(settings, updated, error)) {
      std::cerr << "Error: " << error << std::endl;
      return true;
    }
    ctx.session.mode.set_palette(updated.palette);
    if (updated.highlight) {
      ctx.session.mode.enable();
    } else {
      ctx.session.mode.disable();
    }
    ctx.config = std::move(updated);
    std::cout << "Reloaded config: " << path << std::endl;
    return true;
  };
}

}  // namespace csvhue::cli
