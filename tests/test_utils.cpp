#include "test_utils.h"

#include <filesystem>
#include <fstream>
#include <system_error>

TempFile::TempFile(const std::string& name, const std::string& contents)
    : path((std::filesystem::temp_directory_path() / name).string()) {
  std::ofstream out(path, std::ios::binary);
  out << contents;
}

TempFile::~TempFile() {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

csvhue::PaletteConfig rgb_palette() {
  csvhue::PaletteConfig config;
  config.use_lighter_palette = false;
  config.standard_palette = {"#ff0000", "#00ff00", "#0000ff"};
  config.lighter_palette = csvhue::derive_lighter_palette(config.standard_palette);
  return config;
}

std::vector<csvhue::Annotation> line_annotations(const csvhue::MemoryAnnotationStore& store,
                                                 const csvhue::Document& document,
                                                 size_t line) {
  size_t start = document.line_start(line);
  size_t end = document.line_end(line);
  std::vector<csvhue::Annotation> out;
  for (const auto& annotation : store.all()) {
    if (annotation.start >= start && annotation.end <= end) {
      out.push_back(annotation);
    }
  }
  return out;
}

std::vector<csvhue::AnnotationId> annotation_ids(const std::vector<csvhue::Annotation>& annotations) {
  std::vector<csvhue::AnnotationId> ids;
  ids.reserve(annotations.size());
  for (const auto& annotation : annotations) {
    ids.push_back(annotation.id);
  }
  return ids;
}
