#include "csvhue/field_scanner.h"

namespace csvhue {

FieldScanner::FieldScanner(std::string_view line, char delimiter, size_t base)
    : line_(line), delimiter_(delimiter), base_(base) {}

bool FieldScanner::next(Field& out) {
  const size_t size = line_.size();
  if (pos_ >= size) {
    if (!trailing_field_) {
      return false;
    }
    trailing_field_ = false;
    out = Field{base_ + size, base_ + size, false};
    return true;
  }

  ScanState state = ScanState::FieldStart;
  size_t start = pos_;
  size_t end = pos_;
  bool quoted = false;
  while (true) {
    switch (state) {
      case ScanState::FieldStart:
        if (line_[pos_] == kQuoteChar) {
          quoted = true;
          ++pos_;
          start = pos_;
          state = ScanState::InQuoted;
        } else {
          start = pos_;
          state = ScanState::InUnquoted;
        }
        break;
      case ScanState::InUnquoted:
        while (pos_ < size && line_[pos_] != delimiter_) {
          ++pos_;
        }
        end = pos_;
        finish_field(out, start, end, quoted);
        return true;
      case ScanState::InQuoted:
        while (pos_ < size) {
          if (line_[pos_] == kQuoteChar) {
            if (pos_ + 1 < size && line_[pos_ + 1] == kQuoteChar) {
              pos_ += 2;
              continue;
            }
            break;
          }
          ++pos_;
        }
        if (pos_ >= size) {
          // Unterminated quote: the field runs to line end.
          trailing_field_ = false;
          out = Field{base_ + start, base_ + size, true};
          return true;
        }
        end = pos_;
        ++pos_;
        state = ScanState::AfterQuoteClose;
        break;
      case ScanState::AfterQuoteClose:
        // Stray text after a closing quote belongs to no field.
        while (pos_ < size && line_[pos_] != delimiter_) {
          ++pos_;
        }
        finish_field(out, start, end, quoted);
        return true;
    }
  }
}

void FieldScanner::finish_field(Field& out, size_t start, size_t end, bool quoted) {
  if (pos_ < line_.size()) {
    ++pos_;
    trailing_field_ = pos_ == line_.size();
  } else {
    trailing_field_ = false;
  }
  out = Field{base_ + start, base_ + end, quoted};
}

std::vector<Field> scan_fields(std::string_view line, char delimiter, size_t base) {
  std::vector<Field> fields;
  FieldScanner scanner(line, delimiter, base);
  Field field;
  while (scanner.next(field)) {
    fields.push_back(field);
  }
  return fields;
}

std::string field_value(std::string_view line, const Field& field, size_t base) {
  if (field.start < base || field.end < field.start || field.end - base > line.size()) {
    return {};
  }
  std::string_view raw = line.substr(field.start - base, field.end - field.start);
  if (!field.quoted) {
    return std::string(raw);
  }
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    out.push_back(raw[i]);
    if (raw[i] == kQuoteChar && i + 1 < raw.size() && raw[i + 1] == kQuoteChar) {
      ++i;
    }
  }
  return out;
}

}  // namespace csvhue
