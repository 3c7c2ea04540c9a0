#include "string_encoding.hpp"

#include <iomanip>
#include <sstream>

namespace pbxpatch::pbxproj {

namespace {

bool CharNeedsEscaping(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return false;
  if (c == '$' || c == '.' || c == '/' || c == '_') return false;
  return true;
}

bool NeedsEscaping(const std::string& value) {
  if (value.empty()) return true;
  if (value.find("___") != std::string::npos) return true;

  for (char c : value) {
    if (CharNeedsEscaping(c)) return true;
  }
  return false;
}

} // namespace

std::string EncodeString(const std::string& value) {
  if (!NeedsEscaping(value)) return value;

  std::ostringstream out;
  out << '"';
  for (char c : value) {
    const auto code = static_cast<unsigned char>(c);
    if (code <= 31) {
      switch (c) {
        case '\t':
          out << "\\t";
          break;
        case '\n':
        case '\r':
          out << "\\n";
          break;
        default:
          out << "\\U" << std::hex << std::setw(4) << std::setfill('0') << static_cast<unsigned>(code) << std::dec;
          break;
      }
      continue;
    }

    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
  return out.str();
}

} // namespace pbxpatch::pbxproj
