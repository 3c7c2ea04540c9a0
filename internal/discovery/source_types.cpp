#include "source_types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pbxpatch::discovery {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

SourceTypeRegistry::SourceTypeRegistry(std::vector<SourceType> types) : types_(std::move(types)) {
  for (auto& type : types_) {
    if (type.extension.empty() || type.file_type.empty()) {
      throw std::invalid_argument("source type needs both an extension and a file type");
    }
    if (type.extension.front() != '.') type.extension.insert(type.extension.begin(), '.');
    type.extension = Lower(type.extension);
  }
}

SourceTypeRegistry SourceTypeRegistry::Defaults() {
  return SourceTypeRegistry({
      {".swift", "sourcecode.swift"},
      {".m", "sourcecode.c.objc"},
      {".mm", "sourcecode.cpp.objcpp"},
      {".c", "sourcecode.c.c"},
      {".cc", "sourcecode.cpp.cpp"},
      {".cpp", "sourcecode.cpp.cpp"},
      {".cxx", "sourcecode.cpp.cpp"},
  });
}

std::optional<std::string> SourceTypeRegistry::FileTypeFor(std::string_view file_name) const {
  const auto dot = file_name.find_last_of('.');
  // "Foo.swift" yes, ".swift" and "swift" no
  if (dot == std::string_view::npos || dot == 0) return std::nullopt;

  const auto extension = Lower(file_name.substr(dot));
  for (const auto& type : types_) {
    if (type.extension == extension) return type.file_type;
  }
  return std::nullopt;
}

} // namespace pbxpatch::discovery
