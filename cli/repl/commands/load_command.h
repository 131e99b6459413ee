#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_load_command();

}  // namespace csvhue::cli
