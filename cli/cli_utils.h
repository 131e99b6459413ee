#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "csvhue/document.h"
#include "session.h"

namespace csvhue::cli {

/// Reads a file into memory.
/// MUST throw on missing/unreadable files and MUST not perform network IO.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Reads all stdin content for non-interactive usage.
/// MUST block until EOF and MUST not interpret the stream contents.
std::string read_stdin();
/// Checks whether a string should be treated as a URL.
/// MUST only match http and https.
bool is_url(const std::string& value);
/// Loads CSV text from a path or URL.
/// MUST honor timeouts and MUST reject responses that are not CSV or plain text.
/// Inputs are path/url and timeout; outputs are text with IO side effects.
std::string load_csv_input(const std::string& input, int timeout_ms);

/// Counts lines for display, not counting the empty line after a final newline.
size_t visible_line_count(const Document& document);

/// 0-based inclusive line range selected for display.
struct LineRange {
  size_t first = 0;
  size_t last = 0;
};

/// Parses `A:B`, `A:`, `:B` or `A` (1-based, inclusive) against a document size.
/// An empty spec selects every line. Bounds past the end are clamped.
/// MUST return false with a user-facing error on malformed or reversed ranges.
bool parse_line_range(const std::string& spec, size_t line_count, LineRange& out, std::string& error);
/// Converts a line range into the document region covering it.
Region line_range_region(const Document& document, const LineRange& range);

/// Lists the output modes render_view understands, in help order.
const std::vector<std::string>& output_modes();
/// Returns true when `name` is one of output_modes().
bool is_output_mode(const std::string& name);
/// Joins output_modes() with `|` for usage and error messages.
std::string output_mode_usage();

/// Serializes the fields of a line range with their annotation faces as JSON.
/// MUST report `null` color/face for fields without a highlight annotation.
std::string build_fields_json(const Session& session, const LineRange& range);

/// Produces the text shown for a line range in the given output mode.
/// MUST throw std::invalid_argument for a mode outside output_modes().
/// Inputs are session state and view options; outputs are printable text.
std::string render_view(const Session& session,
                        const LineRange& range,
                        const std::string& output_mode,
                        bool color,
                        bool line_numbers);

}  // namespace csvhue::cli
