#include "csvhue/highlight_driver.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace csvhue {

HighlightDriver::HighlightDriver(const Document& document,
                                 AnnotationStore& store,
                                 PaletteConfig config)
    : document_(document), store_(store), config_(std::move(config)) {
  faces_.rebuild(config_.active());
}

void HighlightDriver::refresh(PaletteConfig config) {
  FaceRegistry faces;
  faces.rebuild(config.active());
  config_ = std::move(config);
  faces_ = std::move(faces);
}

void HighlightDriver::refresh() {
  faces_.rebuild(config_.active());
}

const PaletteConfig& HighlightDriver::config() const {
  return config_;
}

const FaceRegistry& HighlightDriver::faces() const {
  return faces_;
}

void HighlightDriver::on_region_dirty(const Region& region) {
  apply_highlights(region.start, region.end);
}

void HighlightDriver::apply_highlights(size_t region_start, size_t region_end) {
  failures_.clear();
  if (region_end < region_start) {
    std::swap(region_start, region_end);
  }
  size_t size = document_.size();
  region_start = std::min(region_start, size);
  region_end = std::min(region_end, size);
  size_t first = document_.line_at(region_start);
  size_t last = document_.line_at(region_end);
  // The region end is exclusive: a region stopping at a line start leaves that line alone.
  if (last > first && document_.line_start(last) == region_end) {
    --last;
  }
  for (size_t line = first; line <= last; ++line) {
    try {
      highlight_line(line);
    } catch (const std::exception& ex) {
      failures_.push_back(LineFailure{line, ex.what()});
      if (warn_) {
        warn_("Highlight failed on line " + std::to_string(line + 1) + ": " + ex.what());
      }
    }
  }
}

void HighlightDriver::highlight_line(size_t line) {
  evict(line);
  size_t start = document_.line_start(line);
  insert(line, scan_fields(document_.line_text(line), kDefaultDelimiter, start));
}

size_t HighlightDriver::evict(size_t line) {
  // Clear through the terminator: edits that erase a line break collapse
  // annotations onto it, past line_end() on CRLF text.
  size_t end = line + 1 < document_.line_count() ? document_.line_start(line + 1) - 1
                                                 : document_.size();
  return store_.remove_matching(document_.line_start(line), end, kAnnotationTag);
}

std::vector<AnnotationId> HighlightDriver::insert(size_t line, const std::vector<Field>& fields) {
  size_t line_start = document_.line_start(line);
  size_t line_end = document_.line_end(line);
  for (const Field& field : fields) {
    if (field.start < line_start || field.end > line_end || field.start > field.end) {
      throw std::out_of_range("Field outside line " + std::to_string(line + 1));
    }
  }
  std::vector<AnnotationId> ids;
  ids.reserve(fields.size());
  try {
    for (size_t column = 0; column < fields.size(); ++column) {
      const Field& field = fields[column];
      ids.push_back(store_.create(field.start, field.end, faces_.face_for_column(column),
                                  kAnnotationTag));
    }
  } catch (const std::exception&) {
    evict(line);
    throw;
  }
  return ids;
}

size_t HighlightDriver::clear() {
  return store_.remove_matching(0, document_.size(), kAnnotationTag);
}

const std::vector<LineFailure>& HighlightDriver::last_failures() const {
  return failures_;
}

void HighlightDriver::set_warning_handler(WarningHandler handler) {
  warn_ = std::move(handler);
}

}  // namespace csvhue
