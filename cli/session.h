#pragma once

#include <string>

#include "csvhue/annotation_store.h"
#include "csvhue/document.h"
#include "csvhue/highlight_driver.h"
#include "csvhue/highlight_mode.h"
#include "csvhue/palette.h"

namespace csvhue::cli {

/// Bundles one open CSV document with its annotation store, driver and mode.
/// Member order matters: the mode is destroyed first so it can clear the store.
struct Session {
  explicit Session(PaletteConfig palette);

  /// Replaces the document text; highlighting restarts when `highlight` is true.
  void load(std::string text, std::string origin, bool highlight);

  Document document;
  MemoryAnnotationStore store;
  HighlightDriver driver;
  HighlightMode mode;
  std::string source;
};

}  // namespace csvhue::cli
