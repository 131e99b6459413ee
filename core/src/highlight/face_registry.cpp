#include "csvhue/face_registry.h"

#include <stdexcept>
#include <utility>

namespace csvhue {

bool operator==(const Face& lhs, const Face& rhs) {
  return lhs.name == rhs.name && lhs.color == rhs.color && lhs.foreground == rhs.foreground;
}

void FaceRegistry::rebuild(const std::vector<std::string>& palette) {
  std::vector<Face> faces;
  faces.reserve(palette.empty() ? 1 : palette.size());
  for (size_t i = 0; i < palette.size(); ++i) {
    auto parsed = parse_color(palette[i]);
    if (!parsed.has_value()) {
      throw std::invalid_argument("Invalid palette color: " + palette[i]);
    }
    faces.push_back(Face{"csvhue-column-" + std::to_string(i), palette[i], *parsed});
  }
  if (faces.empty()) {
    auto neutral = parse_color(kNeutralColor);
    faces.push_back(Face{"csvhue-neutral", kNeutralColor, neutral.value_or(Rgb{128, 128, 128})});
  }
  faces_ = std::move(faces);
}

const Face& FaceRegistry::face_for_column(size_t column) const {
  if (faces_.empty()) {
    throw std::logic_error("FaceRegistry used before rebuild");
  }
  return faces_[column % faces_.size()];
}

size_t FaceRegistry::size() const {
  return faces_.size();
}

bool FaceRegistry::empty() const {
  return faces_.empty();
}

}  // namespace csvhue
