#pragma once

#include <string>

#include "internal/model/descriptor.hpp"

namespace pbxpatch::pbxproj {

/*
  Loads project.pbxproj text into a model::Descriptor.

  Objects are tokenized section by section. The sections needed to
  register a source file (PBXBuildFile, PBXFileReference, PBXGroup,
  PBXSourcesBuildPhase) must be present.

  Throws util::MalformedDescriptor.
*/
class DescriptorReader {
 public:
  static model::Descriptor Read(std::string text);
};

} // namespace pbxpatch::pbxproj
