#include "docqa_core/util/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace docqa_core::text {

namespace {
bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}
}  // namespace

size_t code_point_length(const std::string &utf8_text) {
  const std::string valid = sanitize_utf8(utf8_text);
  return static_cast<size_t>(utf8::distance(valid.begin(), valid.end()));
}

std::string truncate_code_points(const std::string &utf8_text, size_t max_code_points) {
  const std::string valid = sanitize_utf8(utf8_text);
  auto it = valid.begin();
  for (size_t i = 0; i < max_code_points && it != valid.end(); ++i) {
    utf8::next(it, valid.end());
  }
  return std::string(valid.begin(), it);
}

std::string sanitize_utf8(const std::string &utf8_text) {
  if (utf8::is_valid(utf8_text.begin(), utf8_text.end())) {
    return utf8_text;
  }
  std::string out;
  utf8::replace_invalid(utf8_text.begin(), utf8_text.end(), std::back_inserter(out));
  return out;
}

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](char c) { return is_space(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](char c) { return is_space(c); }).base();
  if (begin >= end) {
    return "";
  }
  return std::string(begin, end);
}

std::string to_lower_ascii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool is_blank(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return is_space(c); });
}

std::vector<std::string> words(const std::string &s) {
  std::vector<std::string> out;
  std::string current;
  for (unsigned char c : s) {
    if (c < 0x80 && std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      out.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    out.push_back(std::move(current));
  }
  return out;
}

}  // namespace docqa_core::text
