#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "csvhue/palette.h"

namespace csvhue {

/// Renderable style derived from one palette color.
struct Face {
  std::string name;
  std::string color;
  Rgb foreground;
};

bool operator==(const Face& lhs, const Face& rhs);

/// Maps column indices to faces built from the active palette.
/// MUST hold at least one face after rebuild so column lookup never divides by zero.
/// Inputs are palettes; outputs are faces with no side effects beyond internal storage.
class FaceRegistry {
 public:
  /// Regenerates every face from the palette, replacing the previous set.
  /// MUST fall back to a single neutral face when the palette is empty and
  /// MUST throw std::invalid_argument on a color that does not parse.
  void rebuild(const std::vector<std::string>& palette);

  /// Returns the face for a 0-based column, cycling through the palette.
  const Face& face_for_column(size_t column) const;

  size_t size() const;
  bool empty() const;

 private:
  std::vector<Face> faces_;
};

}  // namespace csvhue
