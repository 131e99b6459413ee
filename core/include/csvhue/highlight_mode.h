#pragma once

#include <cstddef>

#include "csvhue/annotation_store.h"
#include "csvhue/document.h"
#include "csvhue/highlight_driver.h"
#include "csvhue/palette.h"

namespace csvhue {

/// Registers a highlight driver on a document so edits re-highlight the touched lines.
/// MUST leave no annotations of its own behind once disabled.
/// Inputs are enable/disable calls and document edits; side effects go to the store.
class HighlightMode {
 public:
  HighlightMode(Document& document, AnnotationStore& store, HighlightDriver& driver);
  ~HighlightMode();

  HighlightMode(const HighlightMode&) = delete;
  HighlightMode& operator=(const HighlightMode&) = delete;

  /// Subscribes to edits; regions are painted on demand through paint().
  /// No-op when already enabled.
  void enable();
  /// Unsubscribes and clears every annotation; no-op when already disabled.
  void disable();
  bool enabled() const;

  /// Host redraw hook: highlights a region that became visible. Ignored while disabled.
  void paint(const Region& region);
  /// Refreshes the driver palette and drops annotations painted with the old one.
  /// Throws std::invalid_argument and keeps the old palette when a color does not parse.
  void set_palette(PaletteConfig config);
  /// Repaints the whole document when enabled.
  void rehighlight();

 private:
  void handle_edit(const EditEvent& edit);

  Document& document_;
  AnnotationStore& store_;
  HighlightDriver& driver_;
  size_t subscription_ = 0;
  bool enabled_ = false;
};

}  // namespace csvhue
