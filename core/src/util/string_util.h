#pragma once

#include <string>
#include <vector>

namespace csvhue::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep color lookup deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Splits on a separator and trims each piece.
/// MUST keep empty pieces so callers can reject them.
std::vector<std::string> split_trimmed(const std::string& s, char separator);

}  // namespace csvhue::util
