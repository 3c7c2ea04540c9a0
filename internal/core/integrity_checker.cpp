#include "integrity_checker.hpp"

#include <unordered_set>

namespace pbxpatch::core {

namespace {

bool IsFileLike(const model::ObjectInfo& info) {
  return info.kind == model::ObjectKind::kFileReference || info.isa == "PBXVariantGroup";
}

} // namespace

std::string Violation::ToString() const {
  return owner + "." + field + " -> " + target + ": " + reason;
}

std::vector<Violation> IntegrityChecker::Check(const model::Descriptor& descriptor) const {
  std::vector<Violation> violations;

  for (const auto& file : descriptor.BuildFiles().All()) {
    if (!file.file_ref) continue;
    const auto info = descriptor.Lookup(*file.file_ref);
    if (!info) {
      violations.push_back({file.id, "fileRef", *file.file_ref, "missing"});
    } else if (!IsFileLike(*info)) {
      violations.push_back({file.id, "fileRef", *file.file_ref, std::string("not a file reference (") + info->isa + ")"});
    }
  }

  for (const auto& group : descriptor.Groups().All()) {
    for (const auto& child : group.children.ids) {
      const auto info = descriptor.Lookup(child);
      if (!info) {
        violations.push_back({group.id, "children", child, "missing"});
      } else if (info->kind != model::ObjectKind::kFileReference && info->kind != model::ObjectKind::kGroup) {
        violations.push_back({group.id, "children", child, std::string("not a file reference or group (") + info->isa + ")"});
      }
    }
  }

  for (const auto& phase : descriptor.BuildPhases().All()) {
    std::unordered_set<model::ObjectId> file_refs;
    for (const auto& entry : phase.files.ids) {
      const auto* build_file = descriptor.BuildFiles().Find(entry);
      if (!build_file) {
        const auto info = descriptor.Lookup(entry);
        violations.push_back({phase.id, "files", entry, info ? std::string("not a build file (") + info->isa + ")" : "missing"});
        continue;
      }
      if (build_file->file_ref && !file_refs.insert(*build_file->file_ref).second) {
        violations.push_back({phase.id, "files", entry, "second build file for " + *build_file->file_ref});
      }
    }
  }

  return violations;
}

} // namespace pbxpatch::core
