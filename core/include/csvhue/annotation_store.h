#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "csvhue/document.h"
#include "csvhue/face_registry.h"

namespace csvhue {

/// Tag carried by every annotation the highlight driver creates.
inline constexpr const char* kAnnotationTag = "csvhue";

using AnnotationId = uint64_t;

/// Range-to-face binding applied on top of document text.
struct Annotation {
  AnnotationId id = 0;
  size_t start = 0;
  size_t end = 0;
  Face face;
  std::string tag;
};

/// Host-side annotation store the highlight driver writes into.
/// MUST only be mutated by the highlight driver and its host glue.
/// Inputs are ranges/faces/tags; outputs are annotation handles.
class AnnotationStore {
 public:
  virtual ~AnnotationStore() = default;

  /// Creates an annotation over [start, end) and returns its id.
  /// Implementations MAY throw when the range is invalid.
  virtual AnnotationId create(size_t start, size_t end, const Face& face, const std::string& tag) = 0;
  /// Removes every annotation carrying `tag` whose range touches [start, end].
  /// MUST treat removing nothing as success; returns the count removed.
  virtual size_t remove_matching(size_t start, size_t end, const std::string& tag) = 0;
  /// Moves annotation offsets so they follow the text through an edit.
  virtual void track_edit(const EditEvent& edit) = 0;
};

/// In-memory annotation store used by the terminal front end and tests.
/// MUST keep annotations ordered by start offset for rendering.
class MemoryAnnotationStore : public AnnotationStore {
 public:
  /// MUST throw std::invalid_argument when start > end.
  AnnotationId create(size_t start, size_t end, const Face& face, const std::string& tag) override;
  size_t remove_matching(size_t start, size_t end, const std::string& tag) override;
  /// Offsets after the edit shift by the size delta; offsets inside an erased span
  /// collapse to its start; an annotation starting at an insertion point grows.
  void track_edit(const EditEvent& edit) override;

  /// Returns annotations whose range touches [start, end], ordered by start.
  std::vector<Annotation> in_range(size_t start, size_t end) const;
  std::vector<Annotation> all() const;
  size_t size() const;
  void clear();

 private:
  std::vector<Annotation> annotations_;
  AnnotationId next_id_ = 1;
};

}  // namespace csvhue
