#include "records.hpp"

#include <string_view>

namespace pbxpatch::model {

const char* ToString(ObjectKind kind) {
  switch (kind) {
    case ObjectKind::kFileReference:
      return "file reference";
    case ObjectKind::kBuildFile:
      return "build file";
    case ObjectKind::kGroup:
      return "group";
    case ObjectKind::kBuildPhase:
      return "build phase";
    case ObjectKind::kNativeTarget:
      return "native target";
    case ObjectKind::kProject:
      return "project";
    case ObjectKind::kOther:
    default:
      return "object";
  }
}

std::string FileReference::DisplayName() const {
  if (!name.empty()) return name;

  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string PhaseRole(const std::string& phase_isa) {
  std::string role = phase_isa;
  if (role.rfind("PBX", 0) == 0) role.erase(0, 3);

  constexpr std::string_view kSuffix = "BuildPhase";
  if (role.size() > kSuffix.size() && role.compare(role.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
    role.erase(role.size() - kSuffix.size());
  }
  return role;
}

} // namespace pbxpatch::model
