#pragma once

#include <cstddef>
#include <string>

#include "csvhue/annotation_store.h"
#include "csvhue/document.h"

namespace csvhue::render {

/// Controls how annotated lines are written to the terminal.
struct RenderOptions {
  bool color = true;
  bool line_numbers = false;
};

/// Renders lines [first_line, last_line] with each annotation in its face color.
/// MUST reproduce the line text byte for byte when color is disabled and MUST
/// reset styling after every colored span.
/// Inputs are document/store and a line range; outputs are text with no side effects.
std::string render_lines(const Document& document,
                         const MemoryAnnotationStore& store,
                         size_t first_line,
                         size_t last_line,
                         const RenderOptions& options);

}  // namespace csvhue::render
