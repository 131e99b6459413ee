#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_highlight_command();

}  // namespace csvhue::cli
