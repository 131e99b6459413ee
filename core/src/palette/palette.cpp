#include "csvhue/palette.h"

namespace csvhue {

const std::vector<std::string>& PaletteConfig::active() const {
  return use_lighter_palette ? lighter_palette : standard_palette;
}

std::vector<std::string> default_standard_palette() {
  return {
      "#d75f5f",
      "#5f87d7",
      "#87af5f",
      "#d7875f",
      "#af5fd7",
      "#5fafaf",
      "#d7af5f",
      "#d75faf",
  };
}

std::vector<std::string> derive_lighter_palette(const std::vector<std::string>& palette,
                                                double percent) {
  std::vector<std::string> out;
  out.reserve(palette.size());
  for (const auto& color : palette) {
    out.push_back(lighten_color(color, percent));
  }
  return out;
}

PaletteConfig default_palette_config() {
  PaletteConfig config;
  config.use_lighter_palette = true;
  config.standard_palette = default_standard_palette();
  config.lighter_palette = derive_lighter_palette(config.standard_palette);
  return config;
}

}  // namespace csvhue
