#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "csvhue/annotation_store.h"
#include "csvhue/document.h"
#include "csvhue/face_registry.h"
#include "csvhue/field_scanner.h"
#include "csvhue/palette.h"

namespace csvhue {

/// Records a line whose highlighting could not be applied.
struct LineFailure {
  size_t line = 0;
  std::string message;
};

/// Recomputes per-column highlighting for requested regions of a document.
/// MUST clear its own stale annotations before creating new ones and MUST NOT
/// touch annotations of lines outside the requested region.
/// Inputs are regions; side effects are confined to the annotation store.
class HighlightDriver {
 public:
  using WarningHandler = std::function<void(const std::string&)>;

  /// Binds the driver to a document and store and builds faces from `config`.
  /// MUST NOT outlive the document or the store.
  /// Throws std::invalid_argument when the active palette holds an unknown color.
  HighlightDriver(const Document& document,
                  AnnotationStore& store,
                  PaletteConfig config = default_palette_config());

  /// Replaces the palette configuration and regenerates faces.
  /// MUST leave the previous configuration in place when a color does not parse.
  void refresh(PaletteConfig config);
  /// Regenerates faces from the current configuration.
  void refresh();
  const PaletteConfig& config() const;
  const FaceRegistry& faces() const;

  /// Entry point for the host's redraw hook.
  void on_region_dirty(const Region& region);
  /// Re-highlights every line intersecting [region_start, region_end).
  /// MUST continue with the next line when the store rejects one line.
  void apply_highlights(size_t region_start, size_t region_end);
  /// Re-highlights a single line.
  void highlight_line(size_t line);

  /// Removes this driver's annotations from a line and its terminator; returns how many were removed.
  size_t evict(size_t line);
  /// Creates one annotation per field, colored by column.
  /// MUST leave the line without driver annotations when the store rejects any field.
  std::vector<AnnotationId> insert(size_t line, const std::vector<Field>& fields);
  /// Removes this driver's annotations from the whole document.
  size_t clear();

  /// Failures recorded by the most recent apply_highlights call.
  const std::vector<LineFailure>& last_failures() const;
  void set_warning_handler(WarningHandler handler);

 private:
  const Document& document_;
  AnnotationStore& store_;
  PaletteConfig config_;
  FaceRegistry faces_;
  std::vector<LineFailure> failures_;
  WarningHandler warn_;
};

}  // namespace csvhue
