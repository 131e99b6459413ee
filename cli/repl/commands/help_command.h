#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_help_command();

}  // namespace csvhue::cli
