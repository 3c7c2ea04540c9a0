#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pbxpatch::model {

using ObjectId = std::string;

/*
  Offsets are byte positions in the original descriptor text.
  kNoOffset marks anchors that do not exist in that text.
*/
inline constexpr std::size_t kNoOffset = static_cast<std::size_t>(-1);

enum class ObjectKind {
  kOther = 0,
  kFileReference,
  kBuildFile,
  kGroup,
  kBuildPhase,
  kNativeTarget,
  kProject,
};

const char* ToString(ObjectKind kind);

/*
  Ordered identifier list ("children = ( ... );", "files = ( ... );").

  Entries past `original_size` were appended in the current session.
*/
struct IdList {
  std::vector<ObjectId> ids;
  std::size_t           original_size = 0;

  // Offset of the closing ')' in the original text.
  std::size_t close_offset = kNoOffset;

  bool Contains(const ObjectId& id) const {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
  }

  bool HasAppended() const {
    return ids.size() > original_size;
  }
};

// isa = PBXFileReference
struct FileReference {
  ObjectId    id;
  std::string name; // explicit `name`, often empty
  std::string file_type;
  std::string path;
  std::string source_tree;
  bool        added = false;

  std::string DisplayName() const;
};

// isa = PBXBuildFile
struct BuildFile {
  ObjectId                id;
  std::string             display_name; // "Foo.swift in Sources"
  std::optional<ObjectId> file_ref;
  bool                    added = false;
};

// isa = PBXGroup, PBXVariantGroup, XCVersionGroup
struct Group {
  ObjectId    id;
  std::string isa = "PBXGroup";
  std::string name;
  std::string path;
  std::string source_tree;
  IdList      children;
  bool        added = false;

  std::string DisplayName() const {
    return name.empty() ? path : name;
  }
};

// isa = PBX*BuildPhase
struct BuildPhase {
  ObjectId    id;
  std::string isa;
  std::string name;
  IdList      files;
};

// isa = PBXNativeTarget, read only
struct NativeTarget {
  ObjectId              id;
  std::string           name;
  std::vector<ObjectId> build_phases;
};

/*
  "Foo.swift in Sources": the role suffix Xcode writes in build file comments.
*/
std::string PhaseRole(const std::string& phase_isa);

} // namespace pbxpatch::model
