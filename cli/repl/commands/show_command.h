#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_show_command();

}  // namespace csvhue::cli
