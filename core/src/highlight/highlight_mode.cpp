#include "csvhue/highlight_mode.h"

#include <algorithm>
#include <utility>

namespace csvhue {

HighlightMode::HighlightMode(Document& document, AnnotationStore& store, HighlightDriver& driver)
    : document_(document), store_(store), driver_(driver) {}

HighlightMode::~HighlightMode() {
  disable();
}

void HighlightMode::enable() {
  if (enabled_) return;
  subscription_ = document_.subscribe([this](const EditEvent& edit) { handle_edit(edit); });
  enabled_ = true;
}

void HighlightMode::disable() {
  if (!enabled_) return;
  document_.unsubscribe(subscription_);
  subscription_ = 0;
  enabled_ = false;
  driver_.clear();
}

bool HighlightMode::enabled() const {
  return enabled_;
}

void HighlightMode::paint(const Region& region) {
  if (!enabled_) return;
  driver_.on_region_dirty(region);
}

void HighlightMode::set_palette(PaletteConfig config) {
  driver_.refresh(std::move(config));
  driver_.clear();
}

void HighlightMode::rehighlight() {
  if (!enabled_) return;
  driver_.apply_highlights(0, document_.size());
}

void HighlightMode::handle_edit(const EditEvent& edit) {
  store_.track_edit(edit);
  size_t end = std::min(edit.pos + edit.inserted, document_.size());
  size_t last = document_.line_at(end);
  driver_.on_region_dirty(Region{edit.pos, document_.line_end(last)});
}

}  // namespace csvhue
