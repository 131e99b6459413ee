#include "edit_commands.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace csvhue::cli {

namespace {

/// Splits `.cmd <n> <text>` into a 1-based line number and the untouched text tail.
bool parse_line_argument(const std::string& line, size_t& number, std::string& rest) {
  std::istringstream iss(line);
  std::string cmd;
  std::string raw;
  iss >> cmd >> raw;
  if (raw.empty()) return false;
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size() || value == 0) return false;
    number = static_cast<size_t>(value);
  } catch (const std::exception&) {
    return false;
  }
  std::getline(iss, rest);
  if (!rest.empty() && rest.front() == ' ') {
    rest.erase(rest.begin());
  }
  return true;
}

}  // namespace

CommandHandler make_set_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".set")) {
      return false;
    }
    size_t number = 0;
    std::string text;
    if (!parse_line_argument(line, number, text)) {
      std::cerr << "Usage: .set <n> <text>" << std::endl;
      return true;
    }
    Document& document = ctx.session.document;
    if (number > document.line_count()) {
      std::cerr << "Line " << number << " does not exist (" << document.line_count()
                << " line(s))" << std::endl;
      return true;
    }
    document.replace_line(number - 1, text);
    return true;
  };
}

CommandHandler make_insert_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".insert")) {
      return false;
    }
    size_t number = 0;
    std::string text;
    if (!parse_line_argument(line, number, text)) {
      std::cerr << "Usage: .insert <n> <text>" << std::endl;
      return true;
    }
    Document& document = ctx.session.document;
    if (number > document.line_count() + 1) {
      std::cerr << "Line " << number << " is past the end (" << document.line_count()
                << " line(s))" << std::endl;
      return true;
    }
    document.insert_line(number - 1, text);
    return true;
  };
}

CommandHandler make_delete_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (!matches_command(line, ".delete")) {
      return false;
    }
    size_t number = 0;
    std::string rest;
    if (!parse_line_argument(line, number, rest)) {
      std::cerr << "Usage: .delete <n>" << std::endl;
      return true;
    }
    Document& document = ctx.session.document;
    if (number > document.line_count()) {
      std::cerr << "Line " << number << " does not exist (" << document.line_count()
                << " line(s))" << std::endl;
      return true;
    }
    document.erase_line(number - 1);
    return true;
  };
}

}  // namespace csvhue::cli
