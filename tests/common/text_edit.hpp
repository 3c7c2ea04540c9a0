#pragma once

#include <stdexcept>
#include <string>

namespace pbxpatch::testing {

// Replaces the single occurrence of `from`. Throws if it is missing or repeated.
inline std::string ReplaceOnce(std::string text, const std::string& from, const std::string& to) {
  const auto pos = text.find(from);
  if (pos == std::string::npos) throw std::logic_error("fixture text not found: " + from);
  if (text.find(from, pos + 1) != std::string::npos) throw std::logic_error("fixture text is ambiguous: " + from);
  text.replace(pos, from.size(), to);
  return text;
}

// Removes everything from `begin` up to and including `end`.
inline std::string Cut(std::string text, const std::string& begin, const std::string& end) {
  const auto from = text.find(begin);
  if (from == std::string::npos) throw std::logic_error("fixture text not found: " + begin);
  const auto to = text.find(end, from);
  if (to == std::string::npos) throw std::logic_error("fixture text not found: " + end);
  text.erase(from, to + end.size() - from);
  return text;
}

} // namespace pbxpatch::testing
