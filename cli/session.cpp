#include "session.h"

#include <utility>

namespace csvhue::cli {

Session::Session(PaletteConfig palette)
    : driver(document, store, std::move(palette)), mode(document, store, driver) {}

void Session::load(std::string text, std::string origin, bool highlight) {
  mode.disable();
  document.reset(std::move(text));
  store.clear();
  source = std::move(origin);
  if (highlight) {
    mode.enable();
  }
}

}  // namespace csvhue::cli
