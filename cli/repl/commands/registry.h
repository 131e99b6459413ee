#pragma once

#include <functional>
#include <string>
#include <vector>

#include "repl/core/repl.h"
#include "session.h"

namespace csvhue::cli {

struct CommandContext {
  ReplConfig& config;
  Session& session;
};

using CommandHandler = std::function<bool(const std::string&, CommandContext&)>;

class CommandRegistry {
 public:
  void add(CommandHandler handler);
  bool try_handle(const std::string& line, CommandContext& ctx) const;

 private:
  std::vector<CommandHandler> handlers_;
};

void register_default_commands(CommandRegistry& registry);

/// Returns true when `line` is `name` alone or `name` followed by whitespace.
bool matches_command(const std::string& line, const std::string& name);

}  // namespace csvhue::cli
