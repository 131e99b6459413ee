#include "csvhue/annotation_store.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace csvhue {

namespace {

bool touches(const Annotation& annotation, size_t start, size_t end) {
  return annotation.start <= end && annotation.end >= start;
}

size_t map_through_erase(size_t offset, size_t pos, size_t erased) {
  if (offset <= pos) return offset;
  if (offset >= pos + erased) return offset - erased;
  return pos;
}

}  // namespace

AnnotationId MemoryAnnotationStore::create(size_t start,
                                           size_t end,
                                           const Face& face,
                                           const std::string& tag) {
  if (start > end) {
    throw std::invalid_argument("Invalid annotation range: " + std::to_string(start) + ">" +
                                std::to_string(end));
  }
  Annotation annotation{next_id_++, start, end, face, tag};
  auto it = std::upper_bound(annotations_.begin(), annotations_.end(), start,
                             [](size_t value, const Annotation& a) { return value < a.start; });
  annotations_.insert(it, std::move(annotation));
  return next_id_ - 1;
}

size_t MemoryAnnotationStore::remove_matching(size_t start, size_t end, const std::string& tag) {
  size_t before = annotations_.size();
  annotations_.erase(std::remove_if(annotations_.begin(), annotations_.end(),
                                    [&](const Annotation& a) {
                                      return a.tag == tag && touches(a, start, end);
                                    }),
                     annotations_.end());
  return before - annotations_.size();
}

void MemoryAnnotationStore::track_edit(const EditEvent& edit) {
  for (auto& annotation : annotations_) {
    annotation.start = map_through_erase(annotation.start, edit.pos, edit.erased);
    annotation.end = map_through_erase(annotation.end, edit.pos, edit.erased);
    if (annotation.start > edit.pos) annotation.start += edit.inserted;
    if (annotation.end > edit.pos) annotation.end += edit.inserted;
  }
  std::stable_sort(annotations_.begin(), annotations_.end(),
                   [](const Annotation& lhs, const Annotation& rhs) { return lhs.start < rhs.start; });
}

std::vector<Annotation> MemoryAnnotationStore::in_range(size_t start, size_t end) const {
  std::vector<Annotation> out;
  for (const auto& annotation : annotations_) {
    if (annotation.start > end) break;
    if (touches(annotation, start, end)) {
      out.push_back(annotation);
    }
  }
  return out;
}

std::vector<Annotation> MemoryAnnotationStore::all() const {
  return annotations_;
}

size_t MemoryAnnotationStore::size() const {
  return annotations_.size();
}

void MemoryAnnotationStore::clear() {
  annotations_.clear();
}

}  // namespace csvhue
