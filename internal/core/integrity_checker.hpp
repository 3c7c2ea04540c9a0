#pragma once

#include <string>
#include <vector>

#include "internal/model/descriptor.hpp"

namespace pbxpatch::core {

struct Violation {
  model::ObjectId owner;  // record holding the reference
  std::string     field;  // "fileRef", "children", "files"
  model::ObjectId target; // referenced id
  std::string     reason;

  std::string ToString() const;

  bool operator==(const Violation&) const = default;
};

/*
  IntegrityChecker

  Lists foreign keys that do not resolve to a record of the expected kind:
    PBXBuildFile.fileRef      -> file reference (or variant group)
    PBX*Group.children        -> file reference or group
    PBX*BuildPhase.files      -> build file, one per file reference
*/
class IntegrityChecker {
 public:
  std::vector<Violation> Check(const model::Descriptor& descriptor) const;
};

} // namespace pbxpatch::core
