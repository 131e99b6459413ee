#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_palette_command();

}  // namespace csvhue::cli
