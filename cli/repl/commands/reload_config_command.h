#pragma once

#include "registry.h"

namespace csvhue::cli {

CommandHandler make_reload_config_command();

}  // namespace csvhue::cli
