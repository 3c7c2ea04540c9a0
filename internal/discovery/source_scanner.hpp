#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/discovery/source_candidate.hpp"
#include "internal/discovery/source_types.hpp"

namespace pbxpatch::discovery {

struct ScanOptions {
  std::filesystem::path    root;
  std::vector<std::string> excluded_directories; // directory names, matched anywhere below root
};

/*
  SourceScanner

  Walks the source root for files with a recognized source extension.
  Hidden directories, excluded directory names and .xcodeproj /
  .xcworkspace bundles are not entered. Results are sorted by relative
  path.
*/
class SourceScanner {
 public:
  SourceScanner(ScanOptions options, SourceTypeRegistry types);

  // Throws util::NotFound if the root is not a directory.
  std::vector<SourceCandidate> Scan() const;

  // Turns explicit paths into candidates without filtering by type.
  // Paths under the root are made relative to it.
  std::vector<SourceCandidate> FromPaths(const std::vector<std::string>& paths) const;

  static std::vector<std::string> DefaultExcludedDirectories();

 private:
  bool IsExcludedDirectory(const std::filesystem::path& dir) const;

  ScanOptions        options_;
  SourceTypeRegistry types_;
};

} // namespace pbxpatch::discovery
