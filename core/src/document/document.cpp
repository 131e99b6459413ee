#include "csvhue/document.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace csvhue {

Document::Document(std::string text) : text_(std::move(text)) {
  rebuild_index();
}

const std::string& Document::text() const {
  return text_;
}

size_t Document::size() const {
  return text_.size();
}

bool Document::empty() const {
  return text_.empty();
}

size_t Document::line_count() const {
  return line_starts_.size();
}

size_t Document::line_start(size_t line) const {
  check_line(line);
  return line_starts_[line];
}

size_t Document::line_end(size_t line) const {
  check_line(line);
  size_t end = line + 1 < line_starts_.size() ? line_starts_[line + 1] - 1 : text_.size();
  if (end > line_starts_[line] && text_[end - 1] == '\r') {
    --end;
  }
  return end;
}

std::string_view Document::line_text(size_t line) const {
  size_t start = line_start(line);
  return std::string_view(text_).substr(start, line_end(line) - start);
}

size_t Document::line_at(size_t offset) const {
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  return static_cast<size_t>(it - line_starts_.begin()) - 1;
}

void Document::reset(std::string text) {
  size_t erased = text_.size();
  text_ = std::move(text);
  rebuild_index();
  notify(EditEvent{0, erased, text_.size()});
}

void Document::insert(size_t pos, const std::string& text) {
  apply(pos, 0, text);
}

void Document::erase(size_t pos, size_t count) {
  apply(pos, count, {});
}

void Document::replace_line(size_t line, const std::string& text) {
  size_t start = line_start(line);
  apply(start, line_end(line) - start, text);
}

void Document::insert_line(size_t line, const std::string& text) {
  if (line > line_count()) {
    throw std::out_of_range("Line out of range: " + std::to_string(line));
  }
  if (line < line_count()) {
    apply(line_starts_[line], 0, text + "\n");
  } else {
    apply(text_.size(), 0, "\n" + text);
  }
}

void Document::erase_line(size_t line) {
  check_line(line);
  if (line + 1 < line_starts_.size()) {
    apply(line_starts_[line], line_starts_[line + 1] - line_starts_[line], {});
  } else if (line > 0) {
    size_t start = line_starts_[line] - 1;
    apply(start, text_.size() - start, {});
  } else {
    apply(0, text_.size(), {});
  }
}

size_t Document::subscribe(EditListener listener) {
  size_t handle = next_handle_++;
  listeners_.emplace_back(handle, std::move(listener));
  return handle;
}

void Document::unsubscribe(size_t handle) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [handle](const auto& entry) { return entry.first == handle; }),
                   listeners_.end());
}

void Document::apply(size_t pos, size_t erased, const std::string& inserted) {
  if (pos > text_.size()) {
    throw std::out_of_range("Offset out of range: " + std::to_string(pos));
  }
  erased = std::min(erased, text_.size() - pos);
  text_.replace(pos, erased, inserted);
  rebuild_index();
  notify(EditEvent{pos, erased, inserted.size()});
}

void Document::notify(const EditEvent& event) {
  // Listeners may unsubscribe while being notified.
  auto listeners = listeners_;
  for (const auto& entry : listeners) {
    entry.second(event);
  }
}

void Document::rebuild_index() {
  line_starts_.assign(1, 0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

void Document::check_line(size_t line) const {
  if (line >= line_starts_.size()) {
    throw std::out_of_range("Line out of range: " + std::to_string(line));
  }
}

}  // namespace csvhue
