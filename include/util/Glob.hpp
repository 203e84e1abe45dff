#pragma once
#include <string>

namespace selfaudit::util {

// Shell-style match of a single path component: '*', '?', '[...]' classes
// (with '!' or '^' negation) and '\' escapes. '*' never matches '/'.
[[nodiscard]] bool glob_match(const std::string& pattern, const std::string& name);

// Rejects unterminated character classes and a dangling trailing escape.
[[nodiscard]] bool glob_valid(const std::string& pattern, std::string& err);

} // namespace selfaudit::util
