/**
 * @file string_utils.hpp
 * @brief Small ASCII string helpers shared by the grammars
 */

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace datauri {
namespace string_utils {

/**
 * @brief Characters at or below U+0020 count as whitespace when trimming
 */
constexpr bool is_trim_char(char c) noexcept {
  return static_cast<unsigned char>(c) <= 0x20;
}

inline std::string_view trim(std::string_view s) noexcept {
  std::size_t first = 0;
  std::size_t last = s.size();
  while (first < last && is_trim_char(s[first])) ++first;
  while (last > first && is_trim_char(s[last - 1])) --last;
  return s.substr(first, last - first);
}

constexpr char to_lower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string to_lower(std::string_view s) {
  std::string result(s);
  std::transform(result.begin(), result.end(), result.begin(),
                 to_lower_ascii);
  return result;
}

constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (to_lower_ascii(a[i]) != to_lower_ascii(b[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace string_utils
}  // namespace datauri
