#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/descriptor.hpp"

namespace pbxpatch::model {

/*
  GroupTree

  The group hierarchy reachable from the main group, with the directory
  each group stands for relative to the project directory.

  A `<group>` path is resolved against the parent's directory and a
  `SOURCE_ROOT` path against the project directory. Any other source
  tree (`<absolute>`, BUILT_PRODUCTS_DIR, SDKROOT, ...) has no project
  relative directory, and neither do the groups below it.

  Built from a snapshot; groups added to the descriptor afterwards are
  not seen.
*/
class GroupTree {
 public:
  explicit GroupTree(const Descriptor& descriptor);

  std::optional<std::string> DirectoryOf(const ObjectId& group) const;

  // First PBXGroup in tree order standing for `directory`.
  const Group* FindByDirectory(std::string_view directory) const;

  // Group listing `id` as a child, or nullptr.
  const Group* ParentOf(const ObjectId& id) const;

  // Project-relative location of a file reference.
  std::optional<std::string> Locate(const FileReference& ref) const;

  static std::optional<std::string> Resolve(const std::optional<std::string>& parent_directory, const std::string& source_tree, const std::string& path);

  // `path` as seen from `directory`; both project-relative.
  static std::string RelativeTo(const std::string& path, const std::string& directory);

 private:
  const Descriptor*                                         descriptor_;
  std::vector<ObjectId>                                     order_;
  std::unordered_map<ObjectId, std::optional<std::string>> directories_;
  std::unordered_map<ObjectId, ObjectId>                    parents_;
};

} // namespace pbxpatch::model
