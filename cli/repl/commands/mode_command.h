#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_mode_command();

}  // namespace csvhue::cli
