#pragma once

#include "registry.h"

namespace csvhue::cli {

/// `.set <n> <text>` replaces line n (1-based).
CommandHandler make_set_command();
/// `.insert <n> <text>` inserts a line before line n; n = line count + 1 appends.
CommandHandler make_insert_command();
/// `.delete <n>` removes line n.
CommandHandler make_delete_command();

}  // namespace csvhue::cli
