#include "csvhue/palette.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

#include "util/string_util.h"

namespace csvhue {

namespace {

struct Hsl {
  double h = 0.0;
  double s = 0.0;
  double l = 0.0;
};

const std::unordered_map<std::string, Rgb>& named_colors() {
  static const std::unordered_map<std::string, Rgb> colors = {
      {"black", {0, 0, 0}},
      {"white", {255, 255, 255}},
      {"red", {255, 0, 0}},
      {"green", {0, 255, 0}},
      {"blue", {0, 0, 255}},
      {"yellow", {255, 255, 0}},
      {"cyan", {0, 255, 255}},
      {"magenta", {255, 0, 255}},
      {"orange", {255, 165, 0}},
      {"purple", {160, 32, 240}},
      {"pink", {255, 192, 203}},
      {"brown", {165, 42, 42}},
      {"gold", {255, 215, 0}},
      {"violet", {238, 130, 238}},
      {"turquoise", {64, 224, 208}},
      {"salmon", {250, 128, 114}},
      {"orchid", {218, 112, 214}},
      {"khaki", {240, 230, 140}},
      {"coral", {255, 127, 80}},
      {"tomato", {255, 99, 71}},
      {"gray", {190, 190, 190}},
      {"grey", {190, 190, 190}},
      {"skyblue", {135, 206, 235}},
      {"springgreen", {0, 255, 127}},
      {"steelblue", {70, 130, 180}},
      {"darkorange", {255, 140, 0}},
      {"deeppink", {255, 20, 147}},
      {"dodgerblue", {30, 144, 255}},
      {"forestgreen", {34, 139, 34}},
      {"firebrick", {178, 34, 34}},
  };
  return colors;
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<Rgb> parse_hex(const std::string& digits) {
  std::vector<int> values;
  values.reserve(digits.size());
  for (char c : digits) {
    int v = hex_digit(c);
    if (v < 0) return std::nullopt;
    values.push_back(v);
  }
  if (values.size() == 3) {
    return Rgb{static_cast<uint8_t>(values[0] * 17),
               static_cast<uint8_t>(values[1] * 17),
               static_cast<uint8_t>(values[2] * 17)};
  }
  if (values.size() == 6) {
    return Rgb{static_cast<uint8_t>(values[0] * 16 + values[1]),
               static_cast<uint8_t>(values[2] * 16 + values[3]),
               static_cast<uint8_t>(values[4] * 16 + values[5])};
  }
  return std::nullopt;
}

Hsl to_hsl(const Rgb& color) {
  double r = color.r / 255.0;
  double g = color.g / 255.0;
  double b = color.b / 255.0;
  double max = std::max({r, g, b});
  double min = std::min({r, g, b});
  Hsl out;
  out.l = (max + min) / 2.0;
  double delta = max - min;
  if (delta <= 0.0) {
    return out;
  }
  out.s = out.l <= 0.5 ? delta / (max + min) : delta / (2.0 - max - min);
  if (max == r) {
    out.h = std::fmod((g - b) / delta, 6.0);
  } else if (max == g) {
    out.h = (b - r) / delta + 2.0;
  } else {
    out.h = (r - g) / delta + 4.0;
  }
  out.h /= 6.0;
  if (out.h < 0.0) out.h += 1.0;
  return out;
}

double hue_to_channel(double m1, double m2, double h) {
  if (h < 0.0) h += 1.0;
  if (h > 1.0) h -= 1.0;
  if (h < 1.0 / 6.0) return m1 + (m2 - m1) * h * 6.0;
  if (h < 0.5) return m2;
  if (h < 2.0 / 3.0) return m1 + (m2 - m1) * (2.0 / 3.0 - h) * 6.0;
  return m1;
}

uint8_t to_byte(double channel) {
  double clamped = std::min(1.0, std::max(0.0, channel));
  return static_cast<uint8_t>(std::lround(clamped * 255.0));
}

Rgb from_hsl(const Hsl& hsl) {
  if (hsl.s <= 0.0) {
    uint8_t v = to_byte(hsl.l);
    return Rgb{v, v, v};
  }
  double m2 = hsl.l <= 0.5 ? hsl.l * (1.0 + hsl.s) : hsl.l + hsl.s - hsl.l * hsl.s;
  double m1 = 2.0 * hsl.l - m2;
  return Rgb{to_byte(hue_to_channel(m1, m2, hsl.h + 1.0 / 3.0)),
             to_byte(hue_to_channel(m1, m2, hsl.h)),
             to_byte(hue_to_channel(m1, m2, hsl.h - 1.0 / 3.0))};
}

}  // namespace

bool operator==(const Rgb& lhs, const Rgb& rhs) {
  return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

bool operator!=(const Rgb& lhs, const Rgb& rhs) {
  return !(lhs == rhs);
}

std::optional<Rgb> parse_color(const std::string& spec) {
  std::string trimmed = util::trim_ws(spec);
  if (trimmed.empty()) return std::nullopt;
  if (trimmed[0] == '#') {
    return parse_hex(trimmed.substr(1));
  }
  std::string key;
  key.reserve(trimmed.size());
  for (char c : util::to_lower(trimmed)) {
    if (c == ' ' || c == '-' || c == '_') continue;
    key.push_back(c);
  }
  const auto& colors = named_colors();
  auto it = colors.find(key);
  if (it == colors.end()) return std::nullopt;
  return it->second;
}

std::string to_hex(const Rgb& color) {
  static const char* kDigits = "0123456789abcdef";
  std::string out = "#";
  for (uint8_t channel : {color.r, color.g, color.b}) {
    out.push_back(kDigits[channel >> 4]);
    out.push_back(kDigits[channel & 0x0f]);
  }
  return out;
}

Rgb lighten(const Rgb& color, double percent) {
  Hsl hsl = to_hsl(color);
  hsl.l = std::min(1.0, std::max(0.0, hsl.l + percent / 100.0));
  return from_hsl(hsl);
}

std::string lighten_color(const std::string& spec, double percent) {
  auto parsed = parse_color(spec);
  if (!parsed.has_value()) {
    throw std::invalid_argument("Invalid color: " + spec);
  }
  return to_hex(lighten(*parsed, percent));
}

}  // namespace csvhue
