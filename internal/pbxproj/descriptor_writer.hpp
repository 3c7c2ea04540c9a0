#pragma once

#include <string>

#include "internal/model/descriptor.hpp"

namespace pbxpatch::pbxproj {

/*
  Serializes a model::Descriptor back to project.pbxproj text.

  The original bytes are reused as-is. Session changes are spliced in:
    - new objects go on their own lines right before the
      "End X section" marker of their isa
    - new list entries go right before the closing ')' of the
      group's children / phase's files

  A descriptor without session changes is returned byte for byte.
*/
class DescriptorWriter {
 public:
  static std::string Write(const model::Descriptor& descriptor);
};

} // namespace pbxpatch::pbxproj
