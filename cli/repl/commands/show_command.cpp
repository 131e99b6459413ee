#include "show_command.h"

#include <iostream>
#include <sstream>

#include "cli_utils.h"

namespace csvhue::cli {

CommandHandler make_show_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".show")) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string spec;
    iss >> cmd >> spec;
    Session& session = ctx.session;
    if (session.document.empty()) {
      std::cerr << "No input loaded. Use .load <path|url> or start with --input <path|url>."
                << std::endl;
      return true;
    }
    LineRange range;
    std::string error;
    if (!parse_line_range(spec, visible_line_count(session.document), range, error)) {
      std::cerr << error << std::endl;
      return true;
    }
    session.mode.paint(line_range_region(session.document, range));
    std::cout << render_view(session, range, ctx.config.output_mode, ctx.config.color,
                             ctx.config.line_numbers);
    return true;
  };
}

}  // namespace csvhue::cli
