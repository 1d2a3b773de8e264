#pragma once
#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <vector>

namespace stoich::util {

// split keeping empty fields, "a++b" -> {"a", "", "b"}
static inline std::vector<std::string> split(const std::string &str,
                                             char delimiter) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    auto position = str.find(delimiter, start);
    if (position == std::string::npos) {
      fields.push_back(str.substr(start));
      break;
    }
    fields.push_back(str.substr(start, position - start));
    start = position + 1;
  }
  return fields;
}

static inline std::string join(const std::vector<std::string> &seq,
                               const std::string &sep) {
  std::string res;
  for (size_t i = 0; i < seq.size(); ++i)
    res += seq[i] + ((i != seq.size() - 1) ? sep : "");
  return res;
}

// trim from start (in place)
static inline void ltrim(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

// trim from end (in place)
static inline void rtrim(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

// trim from both ends (in place)
static inline void trim(std::string &s) {
  ltrim(s);
  rtrim(s);
}

// trim from both ends (copying)
static inline std::string trim_copy(std::string s) {
  trim(s);
  return s;
}

static inline void to_lower(std::string &s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
}

static inline std::string to_lower_copy(std::string s) {
  to_lower(s);
  return s;
}

static inline bool is_blank(std::string_view s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

/// Length in bytes of the UTF-8 sequence starting with lead byte c
static inline std::size_t utf8_sequence_length(unsigned char c) {
  if (c < 0x80)
    return 1;
  if ((c >> 5) == 0x6)
    return 2;
  if ((c >> 4) == 0xE)
    return 3;
  if ((c >> 3) == 0x1E)
    return 4;
  return 1;
}

} // namespace stoich::util
