#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core::text {

// Number of Unicode code points. Invalid sequences are counted after replacement.
size_t code_point_length(const std::string &utf8_text);

// First max_code_points code points, never splitting a sequence
std::string truncate_code_points(const std::string &utf8_text, size_t max_code_points);

// Replaces invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string &utf8_text);

std::string trim(const std::string &s);

std::string to_lower_ascii(std::string s);

bool is_blank(const std::string &s);

// Lowercased ASCII alphanumeric runs; other bytes act as separators
std::vector<std::string> words(const std::string &s);

}  // namespace docqa_core::text
