#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pbxpatch::discovery {

struct SourceType {
  std::string extension; // ".swift"
  std::string file_type; // "sourcecode.swift"
};

/*
  Maps recognized source file extensions to the lastKnownFileType tag
  written into new file references. Extensions compare case-insensitively.
*/
class SourceTypeRegistry {
 public:
  explicit SourceTypeRegistry(std::vector<SourceType> types);

  // .swift .m .mm .c .cc .cpp .cxx
  static SourceTypeRegistry Defaults();

  std::optional<std::string> FileTypeFor(std::string_view file_name) const;

  bool IsSource(std::string_view file_name) const {
    return FileTypeFor(file_name).has_value();
  }

 private:
  std::vector<SourceType> types_;
};

} // namespace pbxpatch::discovery
