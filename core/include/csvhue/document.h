#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csvhue {

/// Contiguous span of a document requested for (re)highlighting.
struct Region {
  size_t start = 0;
  size_t end = 0;
};

/// Describes one edit: `erased` bytes removed at `pos`, then `inserted` bytes added there.
struct EditEvent {
  size_t pos = 0;
  size_t erased = 0;
  size_t inserted = 0;
};

/// Holds document text with a line index and notifies listeners of edits.
/// MUST keep the line index sorted and starting at zero after every edit.
/// Inputs are text edits; outputs are line queries and edit notifications.
class Document {
 public:
  using EditListener = std::function<void(const EditEvent&)>;

  Document() = default;
  explicit Document(std::string text);

  const std::string& text() const;
  size_t size() const;
  bool empty() const;

  /// Returns the number of lines; a trailing newline opens a final empty line.
  size_t line_count() const;
  /// Returns the offset of the first byte of a line.
  /// MUST throw std::out_of_range for lines past the end.
  size_t line_start(size_t line) const;
  /// Returns the offset one past the line content, excluding `\n` and a preceding `\r`.
  /// MUST throw std::out_of_range for lines past the end.
  size_t line_end(size_t line) const;
  /// Returns the content of a line without its terminator.
  std::string_view line_text(size_t line) const;
  /// Returns the line containing an offset; offsets past the end map to the last line.
  size_t line_at(size_t offset) const;

  /// Replaces the whole text and reports it as a single edit.
  void reset(std::string text);
  /// Inserts text at a byte offset.
  /// MUST throw std::out_of_range when pos > size().
  void insert(size_t pos, const std::string& text);
  /// Erases up to `count` bytes at a byte offset.
  /// MUST throw std::out_of_range when pos > size().
  void erase(size_t pos, size_t count);

  /// Replaces the content of a line, keeping its terminator.
  void replace_line(size_t line, const std::string& text);
  /// Inserts a new line before `line`; `line == line_count()` appends.
  void insert_line(size_t line, const std::string& text);
  /// Removes a line together with one adjacent line break.
  void erase_line(size_t line);

  /// Registers an edit listener and returns its handle.
  size_t subscribe(EditListener listener);
  /// Removes a listener; unknown handles are ignored.
  void unsubscribe(size_t handle);

 private:
  void apply(size_t pos, size_t erased, const std::string& inserted);
  void notify(const EditEvent& event);
  void rebuild_index();
  void check_line(size_t line) const;

  std::string text_;
  std::vector<size_t> line_starts_{0};
  std::vector<std::pair<size_t, EditListener>> listeners_;
  size_t next_handle_ = 1;
};

}  // namespace csvhue
