#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/records.hpp"

namespace pbxpatch::model {

/*
  Records of one kind, kept in descriptor text order.
*/
template <typename Record>
class RecordTable {
 public:
  void Put(Record record) {
    index_[record.id] = records_.size();
    records_.push_back(std::move(record));
  }

  const Record* Find(const ObjectId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &records_[it->second];
  }

  Record* FindMutable(const ObjectId& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &records_[it->second];
  }

  const std::vector<Record>& All() const {
    return records_;
  }

  std::size_t Size() const {
    return records_.size();
  }

 private:
  std::vector<Record>                       records_;
  std::unordered_map<ObjectId, std::size_t> index_;
};

// Text between the Begin/End section markers of one isa.
struct Section {
  std::string isa;
  std::size_t body_begin = 0;
  std::size_t end_marker = 0; // offset of "/* End ..."
  std::string record_indent = "\t\t";
};

struct ObjectInfo {
  std::string isa;
  ObjectKind  kind = ObjectKind::kOther;
};

/*
  Descriptor

  In-memory graph of a project.pbxproj.

  The original text is kept verbatim. Records parsed from it remember
  the offsets of their insertion anchors; records and list entries added
  in the current session are flagged so the writer can splice them into
  the original bytes without touching anything else.

  Every object in the objects table is indexed (id -> isa, kind), even
  kinds that are not modelled, so uniqueness checks see all ids.
*/
class Descriptor {
 public:
  Descriptor() = default;
  explicit Descriptor(std::string text);

  const std::string& Text() const {
    return text_;
  }

  // ------------------------------------------------------------
  // Loading
  // ------------------------------------------------------------
  void AddSection(Section section);

  // Returns false if the id is already indexed.
  bool IndexObject(const ObjectId& id, const std::string& isa, ObjectKind kind);

  void PutFileReference(FileReference ref);
  void PutBuildFile(BuildFile file);
  void PutGroup(Group group);
  void PutBuildPhase(BuildPhase phase);
  void PutNativeTarget(NativeTarget target);
  void SetMainGroup(ObjectId id);

  // ------------------------------------------------------------
  // Lookups
  // ------------------------------------------------------------
  bool                      HasObject(const ObjectId& id) const;
  std::optional<ObjectInfo> Lookup(const ObjectId& id) const;
  std::unordered_set<ObjectId> Identifiers() const;

  const std::vector<Section>& Sections() const {
    return sections_;
  }
  const Section* FindSection(std::string_view isa) const;

  const RecordTable<FileReference>& FileReferences() const {
    return file_refs_;
  }
  const RecordTable<BuildFile>& BuildFiles() const {
    return build_files_;
  }
  const RecordTable<Group>& Groups() const {
    return groups_;
  }
  const RecordTable<BuildPhase>& BuildPhases() const {
    return build_phases_;
  }
  const RecordTable<NativeTarget>& NativeTargets() const {
    return targets_;
  }

  // First group (text order) whose display name matches.
  const Group*        FindGroupByName(std::string_view display_name) const;
  const NativeTarget* FindNativeTarget(std::string_view name) const;
  const BuildPhase*   FirstBuildPhase(std::string_view isa) const;

  const ObjectId& MainGroup() const {
    return main_group_;
  }

  // ------------------------------------------------------------
  // Session changes
  // ------------------------------------------------------------
  void AddFileReference(FileReference ref);
  void AddBuildFile(BuildFile file);
  void AddGroup(Group group);
  void AppendGroupChild(const ObjectId& group, const ObjectId& child);
  void AppendBuildPhaseEntry(const ObjectId& phase, const ObjectId& build_file);

  // Objects created in this session, in creation order.
  const std::vector<ObjectId>& AddedObjects() const {
    return added_;
  }

  bool HasChanges() const;

 private:
  std::string          text_;
  std::vector<Section> sections_;

  std::unordered_map<ObjectId, ObjectInfo> objects_;

  RecordTable<FileReference> file_refs_;
  RecordTable<BuildFile>     build_files_;
  RecordTable<Group>         groups_;
  RecordTable<BuildPhase>    build_phases_;
  RecordTable<NativeTarget>  targets_;

  ObjectId              main_group_;
  std::vector<ObjectId> added_;
  bool                  lists_changed_ = false;
};

} // namespace pbxpatch::model
