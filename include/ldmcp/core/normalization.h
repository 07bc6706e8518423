#pragma once

#include <string>
#include <string_view>

namespace ldmcp::core {

// Locale-independent ASCII helpers. Non-ASCII bytes pass through unchanged,
// so UTF-8 input is never split or rewritten.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string_view trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return input.substr(start, end - start);
}

inline bool is_blank(const std::string_view input) {
  return trim(input).empty();
}

inline bool contains(const std::string_view haystack, const std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

}  // namespace ldmcp::core
