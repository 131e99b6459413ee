#include "cli_utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "csvhue/field_scanner.h"
#include "render/ansi_renderer.h"

namespace csvhue::cli {

namespace {

/// Appends curl response chunks into the caller-owned buffer.
/// MUST return the full byte count or curl will treat it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string normalize_content_type(const char* raw) {
  if (!raw) return "";
  std::string value(raw);
  size_t end = value.find(';');
  if (end != std::string::npos) {
    value = value.substr(0, end);
  }
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  size_t finish = value.size();
  while (finish > start && std::isspace(static_cast<unsigned char>(value[finish - 1]))) {
    --finish;
  }
  value = value.substr(start, finish - start);
  for (char& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

void validate_content_type(CURL* curl) {
  const char* raw = nullptr;
  CURLcode info = curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &raw);
  if (info != CURLE_OK) {
    throw std::runtime_error("Failed to read Content-Type for URL");
  }
  std::string content_type = normalize_content_type(raw);
  if (content_type.empty()) {
    throw std::runtime_error("Missing Content-Type for URL");
  }
  if (content_type == "text/csv" ||
      content_type == "application/csv" ||
      content_type == "text/comma-separated-values" ||
      content_type == "text/plain" ||
      content_type == "application/octet-stream") {
    return;
  }
  throw std::runtime_error("Unsupported Content-Type for CSV fetch: " + content_type);
}

bool parse_line_number(const std::string& raw, size_t& out) {
  if (raw.empty()) return false;
  for (char c : raw) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  try {
    out = static_cast<size_t>(std::stoull(raw));
  } catch (const std::exception&) {
    return false;
  }
  return out > 0;
}

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

bool is_url(const std::string& value) {
  return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

std::string load_csv_input(const std::string& input, int timeout_ms) {
  if (!is_url(input)) {
    return read_file(input);
  }
  if (timeout_ms <= 0) {
    throw std::invalid_argument("Timeout must be positive: " + std::to_string(timeout_ms));
  }
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  std::string buffer;
  const CURLcode setup[] = {
      curl_easy_setopt(curl, CURLOPT_URL, input.c_str()),
      curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L),
      curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""),
      curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string),
      curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer),
      curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms)),
      curl_easy_setopt(curl, CURLOPT_USERAGENT, "csvhue/0.1"),
  };
  for (CURLcode code : setup) {
    if (code != CURLE_OK) {
      curl_easy_cleanup(curl);
      throw std::runtime_error(std::string("Failed to configure URL fetch: ") +
                               curl_easy_strerror(code));
    }
  }
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    curl_easy_cleanup(curl);
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  try {
    validate_content_type(curl);
  } catch (const std::exception&) {
    curl_easy_cleanup(curl);
    throw;
  }
  curl_easy_cleanup(curl);
  return buffer;
}

size_t visible_line_count(const Document& document) {
  size_t count = document.line_count();
  if (count > 1 && !document.empty() && document.text().back() == '\n') {
    --count;
  }
  return count;
}

bool parse_line_range(const std::string& spec, size_t line_count, LineRange& out, std::string& error) {
  if (line_count == 0) {
    error = "Document has no lines";
    return false;
  }
  out = LineRange{0, line_count - 1};
  if (spec.empty()) {
    return true;
  }
  size_t colon = spec.find(':');
  std::string first_raw = colon == std::string::npos ? spec : spec.substr(0, colon);
  std::string last_raw = colon == std::string::npos ? spec : spec.substr(colon + 1);
  size_t first = 1;
  size_t last = line_count;
  if (!first_raw.empty() && !parse_line_number(first_raw, first)) {
    error = "Invalid line range: " + spec;
    return false;
  }
  if (!last_raw.empty() && !parse_line_number(last_raw, last)) {
    error = "Invalid line range: " + spec;
    return false;
  }
  if (first > last) {
    error = "Invalid line range (start after end): " + spec;
    return false;
  }
  if (first > line_count) {
    error = "Line range starts past the last line (" + std::to_string(line_count) + ")";
    return false;
  }
  out.first = first - 1;
  out.last = std::min(last, line_count) - 1;
  return true;
}

Region line_range_region(const Document& document, const LineRange& range) {
  return Region{document.line_start(range.first), document.line_end(range.last)};
}

const std::vector<std::string>& output_modes() {
  static const std::vector<std::string> kModes = {"ansi", "json", "plain"};
  return kModes;
}

bool is_output_mode(const std::string& name) {
  const auto& modes = output_modes();
  return std::find(modes.begin(), modes.end(), name) != modes.end();
}

std::string output_mode_usage() {
  std::string out;
  for (const auto& mode : output_modes()) {
    if (!out.empty()) out += "|";
    out += mode;
  }
  return out;
}

std::string build_fields_json(const Session& session, const LineRange& range) {
  using nlohmann::json;
  const Document& document = session.document;
  json out = json::array();
  for (size_t line = range.first; line <= range.last && line < document.line_count(); ++line) {
    size_t start = document.line_start(line);
    std::string_view text = document.line_text(line);
    auto annotations = session.store.in_range(start, document.line_end(line));
    json fields = json::array();
    auto scanned = scan_fields(text, kDefaultDelimiter, start);
    for (size_t column = 0; column < scanned.size(); ++column) {
      const Field& field = scanned[column];
      json obj = json::object();
      obj["column"] = column;
      obj["start"] = field.start;
      obj["end"] = field.end;
      obj["value"] = field_value(text, field, start);
      auto it = std::find_if(annotations.begin(), annotations.end(), [&](const Annotation& a) {
        return a.tag == kAnnotationTag && a.start == field.start && a.end == field.end;
      });
      if (it != annotations.end()) {
        obj["color"] = it->face.color;
        obj["face"] = it->face.name;
      } else {
        obj["color"] = nullptr;
        obj["face"] = nullptr;
      }
      fields.push_back(std::move(obj));
    }
    json entry = json::object();
    entry["line"] = line + 1;
    entry["fields"] = std::move(fields);
    out.push_back(std::move(entry));
  }
  return out.dump(2);
}

std::string render_view(const Session& session,
                        const LineRange& range,
                        const std::string& output_mode,
                        bool color,
                        bool line_numbers) {
  if (!is_output_mode(output_mode)) {
    throw std::invalid_argument("Unknown output mode: " + output_mode);
  }
  if (output_mode == "json") {
    return build_fields_json(session, range) + "\n";
  }
  render::RenderOptions options;
  options.color = color && output_mode == "ansi";
  options.line_numbers = line_numbers;
  return render::render_lines(session.document, session.store, range.first, range.last, options);
}

}  // namespace csvhue::cli
