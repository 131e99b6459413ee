#include "render/ansi_renderer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "ui/color.h"

namespace csvhue::render {

namespace {

void append_line(std::ostringstream& out,
                 const Document& document,
                 const MemoryAnnotationStore& store,
                 size_t line,
                 bool color) {
  std::string_view text = document.line_text(line);
  if (!color) {
    out << text;
    return;
  }
  size_t start = document.line_start(line);
  size_t end = document.line_end(line);
  size_t cursor = start;
  for (const auto& annotation : store.in_range(start, end)) {
    if (annotation.start == annotation.end) continue;
    size_t span_start = std::max(annotation.start, cursor);
    size_t span_end = std::min(annotation.end, end);
    if (span_start >= span_end) continue;
    out << text.substr(cursor - start, span_start - cursor);
    out << cli::ansi_foreground(annotation.face.foreground)
        << text.substr(span_start - start, span_end - span_start) << cli::kColor.reset;
    cursor = span_end;
  }
  out << text.substr(cursor - start);
}

}  // namespace

std::string render_lines(const Document& document,
                         const MemoryAnnotationStore& store,
                         size_t first_line,
                         size_t last_line,
                         const RenderOptions& options) {
  std::ostringstream out;
  if (document.empty() || first_line > last_line) {
    return {};
  }
  last_line = std::min(last_line, document.line_count() - 1);
  int width = static_cast<int>(std::to_string(last_line + 1).size());
  for (size_t line = first_line; line <= last_line; ++line) {
    if (options.line_numbers) {
      if (options.color) out << cli::kColor.dim;
      out << std::setw(width) << (line + 1) << " | ";
      if (options.color) out << cli::kColor.reset;
    }
    append_line(out, document, store, line, options.color);
    out << "\n";
  }
  return out.str();
}

}  // namespace csvhue::render
