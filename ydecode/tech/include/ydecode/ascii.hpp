#pragma once

#include <cstddef>
#include <string_view>

namespace ydecode {

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

constexpr unsigned char toupper(unsigned char ch) {
  if (ch >= 'a' && ch <= 'z') {
    ch &= 0xDF;  // clear lowercase bit
  }
  return ch;
}

constexpr char toupper(char ch) { return static_cast<char>(toupper(static_cast<unsigned char>(ch))); }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Case-insensitive substring search.
// 'needle' is compared as is against the lower cased haystack, so it should be given in lower case.
constexpr bool ContainsLowerCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  if (haystack.size() < needle.size()) {
    return false;
  }
  const std::size_t last = haystack.size() - needle.size();
  for (std::size_t pos = 0; pos <= last; ++pos) {
    if (tolower(haystack[pos]) != needle[0]) {
      continue;
    }
    std::size_t matched = 1;
    while (matched < needle.size() && tolower(haystack[pos + matched]) == needle[matched]) {
      ++matched;
    }
    if (matched == needle.size()) {
      return true;
    }
  }
  return false;
}

}  // namespace ydecode
