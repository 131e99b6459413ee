#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace csvhue {

/// Delimiter used for highlighting; CSV columns are always comma separated.
inline constexpr char kDefaultDelimiter = ',';
/// Character that opens and closes a quoted field.
inline constexpr char kQuoteChar = '"';

/// Describes one CSV value on a single line as a half-open offset range.
/// MUST exclude surrounding quotes and the trailing delimiter.
/// Inputs are scanner output; outputs are consumed by the highlight driver.
struct Field {
  size_t start = 0;
  size_t end = 0;
  bool quoted = false;
};

/// Enumerates the per-line scanner states.
/// MUST start at FieldStart for every field and MUST NOT persist across lines.
enum class ScanState {
  FieldStart,
  InUnquoted,
  InQuoted,
  AfterQuoteClose
};

/// Splits one line of CSV text into field ranges, one field per call.
/// MUST never fail: malformed input resolves to best-effort boundaries.
/// Inputs are a line view and delimiter; outputs are fields with absolute offsets.
class FieldScanner {
 public:
  /// Constructs a scanner over a line whose first byte sits at `base`.
  /// MUST NOT outlive the buffer the view points into.
  FieldScanner(std::string_view line, char delimiter = kDefaultDelimiter, size_t base = 0);

  /// Produces the next field of the line.
  /// MUST return false once the line is exhausted and MUST emit a trailing
  /// empty field when the line ends with a delimiter.
  bool next(Field& out);

 private:
  /// Consumes a delimiter at the cursor and records whether it ended the line.
  void finish_field(Field& out, size_t start, size_t end, bool quoted);

  std::string_view line_;
  char delimiter_;
  size_t base_;
  size_t pos_ = 0;
  bool trailing_field_ = false;
};

/// Scans a whole line into its ordered field list.
/// MUST return an empty list for an empty line and delimiter_count + 1 fields otherwise.
/// Inputs are a line, delimiter and base offset; outputs are fields with no side effects.
std::vector<Field> scan_fields(std::string_view line,
                               char delimiter = kDefaultDelimiter,
                               size_t base = 0);

/// Returns the literal value of a field, collapsing doubled quotes in quoted fields.
/// `base` MUST be the same offset that was used to scan the line.
std::string field_value(std::string_view line, const Field& field, size_t base = 0);

}  // namespace csvhue
