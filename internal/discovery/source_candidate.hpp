#pragma once

#include <string>

namespace pbxpatch::discovery {

// A file found on disk that may need registering.
struct SourceCandidate {
  std::string display_name;  // base name, e.g. "ChatViewController.swift"
  std::string relative_path; // relative to the source root, '/' separated
};

} // namespace pbxpatch::discovery
