#include "registry.h"

#include <cctype>
#include <utility>

#include "edit_commands.h"
#include "help_command.h"
#include "highlight_command.h"
#include "load_command.h"
#include "mode_command.h"
#include "palette_command.h"
#include "reload_config_command.h"
#include "show_command.h"

namespace csvhue::cli {

void CommandRegistry::add(CommandHandler handler) {
  handlers_.push_back(std::move(handler));
}

bool CommandRegistry::try_handle(const std::string& line, CommandContext& ctx) const {
  for (const auto& handler : handlers_) {
    if (handler(line, ctx)) {
      return true;
    }
  }
  return false;
}

void register_default_commands(CommandRegistry& registry) {
  registry.add(make_help_command());
  registry.add(make_load_command());
  registry.add(make_show_command());
  registry.add(make_set_command());
  registry.add(make_insert_command());
  registry.add(make_delete_command());
  registry.add(make_highlight_command());
  registry.add(make_palette_command());
  registry.add(make_mode_command());
  registry.add(make_reload_config_command());
}

bool matches_command(const std::string& line, const std::string& name) {
  if (line.rfind(name, 0) != 0) return false;
  return line.size() == name.size() ||
         std::isspace(static_cast<unsigned char>(line[name.size()]));
}

}  // namespace csvhue::cli
