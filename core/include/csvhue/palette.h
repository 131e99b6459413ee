#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace csvhue {

/// Amount, in percent of HSL lightness, separating the lighter palette from the standard one.
inline constexpr double kLighterPercent = 30.0;
/// Color used when the active palette is empty.
inline constexpr const char* kNeutralColor = "#808080";

/// Holds an 8-bit-per-channel color.
struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
};

bool operator==(const Rgb& lhs, const Rgb& rhs);
bool operator!=(const Rgb& lhs, const Rgb& rhs);

/// Parses `#rgb`, `#rrggbb` or a named color (case-insensitive).
/// MUST return nullopt on unknown names or malformed hex and MUST NOT throw.
/// Inputs are color specs; outputs are colors with no side effects.
std::optional<Rgb> parse_color(const std::string& spec);

/// Formats a color as lowercase `#rrggbb`.
std::string to_hex(const Rgb& color);

/// Raises HSL lightness by `percent` points, clamped to white.
/// MUST keep hue and saturation unchanged.
/// Inputs are a color and percent; outputs are the lightened color.
Rgb lighten(const Rgb& color, double percent);

/// Lightens a color spec and returns it as `#rrggbb`.
/// MUST throw std::invalid_argument when the spec does not parse.
std::string lighten_color(const std::string& spec, double percent);

/// Holds the palette configuration read by the highlight driver.
/// MUST be treated as a value: the driver copies it on refresh.
/// Inputs are user/host settings; outputs select the colors cycled across columns.
struct PaletteConfig {
  bool use_lighter_palette = true;
  std::vector<std::string> standard_palette;
  std::vector<std::string> lighter_palette;

  /// Returns the palette selected by use_lighter_palette.
  const std::vector<std::string>& active() const;
};

/// Returns the built-in standard palette.
std::vector<std::string> default_standard_palette();

/// Lightens every entry of a palette.
/// MUST preserve order and size and MUST throw std::invalid_argument on unknown colors.
std::vector<std::string> derive_lighter_palette(const std::vector<std::string>& palette,
                                                double percent = kLighterPercent);

/// Builds the default configuration: built-in palette, its lighter variant, lighter active.
PaletteConfig default_palette_config();

}  // namespace csvhue
