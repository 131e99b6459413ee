#include "color.h"

namespace csvhue::cli {

/// Holds the singleton color palette used by CLI rendering.
/// MUST match the declaration in the header and MUST not be redefined elsewhere.
Color kColor;

std::string ansi_foreground(const Rgb& color) {
  return "\033[38;2;" + std::to_string(color.r) + ";" + std::to_string(color.g) + ";" +
         std::to_string(color.b) + "m";
}

}  // namespace csvhue::cli
