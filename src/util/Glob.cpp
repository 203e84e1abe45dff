#include "util/Glob.hpp"

#include <fnmatch.h>

namespace selfaudit::util {

bool glob_match(const std::string& pattern, const std::string& name) {
  return ::fnmatch(pattern.c_str(), name.c_str(), FNM_PATHNAME) == 0;
}

bool glob_valid(const std::string& pattern, std::string& err) {
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\') {
      if (i + 1 == pattern.size()) { err = "trailing escape in pattern"; return false; }
      ++i;
      continue;
    }
    if (c != '[') continue;
    size_t j = i + 1;
    if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) ++j;
    // A ']' right after the opening bracket is a literal member
    if (j < pattern.size() && pattern[j] == ']') ++j;
    bool closed = false;
    for (; j < pattern.size(); ++j) {
      if (pattern[j] == '\\') { ++j; continue; }
      if (pattern[j] == ']') { closed = true; break; }
    }
    if (!closed) { err = "unterminated character class in pattern"; return false; }
    i = j;
  }
  return true;
}

} // namespace selfaudit::util
