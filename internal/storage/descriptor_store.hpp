#pragma once

#include <string>

namespace pbxpatch::storage {

/*
  Descriptor storage abstraction.

  The pipeline reads the whole descriptor, computes the new text in
  memory and replaces the whole descriptor in one call.

  Implementations:
    FILE     -> project.pbxproj on disk, atomic replace
    MEMORY   -> in-process string (tests, previews)
*/

class DescriptorStore {
 public:
  virtual ~DescriptorStore() = default;

  // ------------------------------------------------------------------
  // ReadAll
  // ------------------------------------------------------------------
  /*
    Returns the descriptor bytes unchanged.
    Throws util::NotFound if there is no descriptor.
  */
  virtual std::string ReadAll() = 0;

  // ------------------------------------------------------------------
  // ReplaceAll
  // ------------------------------------------------------------------
  /*
    Replaces the descriptor. Readers see either the old or the new
    text, never a mix.
  */
  virtual void ReplaceAll(const std::string& text) = 0;

  // Human-readable location for logs.
  virtual std::string Describe() const = 0;
};

} // namespace pbxpatch::storage
