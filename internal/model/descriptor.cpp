#include "descriptor.hpp"

#include <stdexcept>

namespace pbxpatch::model {

Descriptor::Descriptor(std::string text) : text_(std::move(text)) {
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------

void Descriptor::AddSection(Section section) {
  sections_.push_back(std::move(section));
}

bool Descriptor::IndexObject(const ObjectId& id, const std::string& isa, ObjectKind kind) {
  return objects_.emplace(id, ObjectInfo{isa, kind}).second;
}

void Descriptor::PutFileReference(FileReference ref) {
  file_refs_.Put(std::move(ref));
}

void Descriptor::PutBuildFile(BuildFile file) {
  build_files_.Put(std::move(file));
}

void Descriptor::PutGroup(Group group) {
  groups_.Put(std::move(group));
}

void Descriptor::PutBuildPhase(BuildPhase phase) {
  build_phases_.Put(std::move(phase));
}

void Descriptor::PutNativeTarget(NativeTarget target) {
  targets_.Put(std::move(target));
}

void Descriptor::SetMainGroup(ObjectId id) {
  main_group_ = std::move(id);
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

bool Descriptor::HasObject(const ObjectId& id) const {
  return objects_.contains(id);
}

std::optional<ObjectInfo> Descriptor::Lookup(const ObjectId& id) const {
  auto it = objects_.find(id);
  if (it == objects_.end()) return std::nullopt;
  return it->second;
}

std::unordered_set<ObjectId> Descriptor::Identifiers() const {
  std::unordered_set<ObjectId> ids;
  ids.reserve(objects_.size());
  for (const auto& [id, _] : objects_)
    ids.insert(id);
  return ids;
}

const Section* Descriptor::FindSection(std::string_view isa) const {
  for (const auto& section : sections_) {
    if (section.isa == isa) return &section;
  }
  return nullptr;
}

const Group* Descriptor::FindGroupByName(std::string_view display_name) const {
  for (const auto& group : groups_.All()) {
    if (group.isa == "PBXGroup" && group.DisplayName() == display_name) return &group;
  }
  return nullptr;
}

const NativeTarget* Descriptor::FindNativeTarget(std::string_view name) const {
  for (const auto& target : targets_.All()) {
    if (target.name == name) return &target;
  }
  return nullptr;
}

const BuildPhase* Descriptor::FirstBuildPhase(std::string_view isa) const {
  for (const auto& phase : build_phases_.All()) {
    if (phase.isa == isa) return &phase;
  }
  return nullptr;
}

// ------------------------------------------------------------
// Session changes
// ------------------------------------------------------------

void Descriptor::AddFileReference(FileReference ref) {
  ref.added = true;
  IndexObject(ref.id, "PBXFileReference", ObjectKind::kFileReference);
  added_.push_back(ref.id);
  file_refs_.Put(std::move(ref));
}

void Descriptor::AddBuildFile(BuildFile file) {
  file.added = true;
  IndexObject(file.id, "PBXBuildFile", ObjectKind::kBuildFile);
  added_.push_back(file.id);
  build_files_.Put(std::move(file));
}

void Descriptor::AddGroup(Group group) {
  group.added                  = true;
  group.children.original_size = 0;
  group.children.close_offset  = kNoOffset;
  IndexObject(group.id, group.isa, ObjectKind::kGroup);
  added_.push_back(group.id);
  groups_.Put(std::move(group));
}

void Descriptor::AppendGroupChild(const ObjectId& group, const ObjectId& child) {
  auto* record = groups_.FindMutable(group);
  if (!record) throw std::out_of_range("unknown group " + group);

  record->children.ids.push_back(child);
  lists_changed_ = true;
}

void Descriptor::AppendBuildPhaseEntry(const ObjectId& phase, const ObjectId& build_file) {
  auto* record = build_phases_.FindMutable(phase);
  if (!record) throw std::out_of_range("unknown build phase " + phase);

  record->files.ids.push_back(build_file);
  lists_changed_ = true;
}

bool Descriptor::HasChanges() const {
  return !added_.empty() || lists_changed_;
}

} // namespace pbxpatch::model
