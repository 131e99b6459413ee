#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "csvhue/annotation_store.h"
#include "csvhue/document.h"
#include "csvhue/palette.h"

/// Redirects a stream into a buffer for the lifetime of the capture.
struct StreamCapture {
  std::ostream* stream = nullptr;
  std::ostringstream buffer;
  std::streambuf* original = nullptr;

  explicit StreamCapture(std::ostream& target)
      : stream(&target), original(target.rdbuf(buffer.rdbuf())) {}
  ~StreamCapture() {
    if (stream && original) {
      buffer.flush();
      stream->rdbuf(original);
    }
  }

  std::string str() const { return buffer.str(); }
};

/// Writes a file under the system temp directory and removes it on destruction.
struct TempFile {
  std::string path;

  TempFile(const std::string& name, const std::string& contents);
  ~TempFile();
};

/// Three-color standard palette with the lighter palette disabled.
csvhue::PaletteConfig rgb_palette();

/// Annotations whose range lies on one line.
std::vector<csvhue::Annotation> line_annotations(const csvhue::MemoryAnnotationStore& store,
                                                 const csvhue::Document& document,
                                                 size_t line);

/// Ids of every annotation in the store, in store order.
std::vector<csvhue::AnnotationId> annotation_ids(const std::vector<csvhue::Annotation>& annotations);
