#include "mutation_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "internal/model/group_tree.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pbxpatch::core {

namespace {

constexpr char kSourcesPhase[] = "PBXSourcesBuildPhase";
constexpr char kGroupTree[]    = "<group>";
constexpr char kSourceRoot[]   = "SOURCE_ROOT";

struct Placement {
  std::string path;      // normalized, "Features/Chat/ChatView.swift"
  std::string directory; // "Features/Chat", empty for top-level files
};

Placement Locate(const discovery::SourceCandidate& candidate) {
  Placement placement;
  placement.path = std::filesystem::path(candidate.relative_path).lexically_normal().generic_string();
  if (placement.path.empty()) placement.path = candidate.display_name;

  const auto slash = placement.path.find_last_of('/');
  if (slash != std::string::npos) placement.directory = placement.path.substr(0, slash);
  return placement;
}

bool OutsideSourceRoot(const std::string& relative_path) {
  const std::filesystem::path path(relative_path);
  if (path.has_root_path()) return true;
  const auto normalized = path.lexically_normal();
  return !normalized.empty() && *normalized.begin() == "..";
}

const model::Group& RequireChildrenList(const model::Group& group) {
  if (!group.added && group.children.close_offset == model::kNoOffset) {
    throw util::AnchorNotFound("group " + group.id + " (" + group.DisplayName() + ") has no children list");
  }
  return group;
}

// Group receiving a file, with the directory it stands for if known.
struct Destination {
  model::ObjectId            group;
  std::optional<std::string> directory;
};

} // namespace

MutationPlanner::MutationPlanner(PlannerOptions options, discovery::SourceTypeRegistry types, std::shared_ptr<util::ObjectIdGenerator> ids)
    : options_(std::move(options)), types_(std::move(types)), ids_(std::move(ids)) {
  if (!ids_) {
    throw std::invalid_argument("MutationPlanner requires an id generator");
  }
}

const model::BuildPhase& MutationPlanner::ResolveBuildPhase(const model::Descriptor& descriptor) const {
  const model::BuildPhase* phase = nullptr;

  if (options_.target_name.empty()) {
    phase = descriptor.FirstBuildPhase(kSourcesPhase);
    if (!phase) throw util::AnchorNotFound("descriptor has no PBXSourcesBuildPhase");
  } else {
    const auto* target = descriptor.FindNativeTarget(options_.target_name);
    if (!target) throw util::AnchorNotFound("native target not found: " + options_.target_name);

    for (const auto& id : target->build_phases) {
      const auto* candidate = descriptor.BuildPhases().Find(id);
      if (candidate && candidate->isa == kSourcesPhase) {
        phase = candidate;
        break;
      }
    }
    if (!phase) throw util::AnchorNotFound("native target " + options_.target_name + " has no sources build phase");
  }

  if (phase->files.close_offset == model::kNoOffset) {
    throw util::AnchorNotFound("build phase " + phase->id + " has no files list");
  }
  return *phase;
}

const model::Group& MutationPlanner::ResolveFallbackGroup(const model::Descriptor& descriptor) const {
  if (!options_.default_group.empty()) {
    const auto* group = descriptor.FindGroupByName(options_.default_group);
    if (!group) throw util::AnchorNotFound("group not found: " + options_.default_group);
    return *group;
  }

  if (descriptor.MainGroup().empty()) {
    throw util::AnchorNotFound("project has no mainGroup");
  }
  const auto* group = descriptor.Groups().Find(descriptor.MainGroup());
  if (!group) throw util::AnchorNotFound("main group not found: " + descriptor.MainGroup());
  return *group;
}

MutationPlan MutationPlanner::Plan(const model::Descriptor& descriptor, const std::vector<discovery::SourceCandidate>& candidates) const {
  MutationPlan plan;

  std::unordered_set<std::string> registered;
  for (const auto& ref : descriptor.FileReferences().All()) {
    registered.insert(ref.DisplayName());
  }

  std::vector<std::pair<discovery::SourceCandidate, std::string>> pending; // candidate, file type
  for (const auto& candidate : candidates) {
    auto file_type = types_.FileTypeFor(candidate.display_name);
    if (!file_type) {
      plan.skipped.push_back({candidate, SkipReason::kUnrecognizedType});
      continue;
    }
    if (OutsideSourceRoot(candidate.relative_path)) {
      plan.skipped.push_back({candidate, SkipReason::kOutsideSourceRoot});
      continue;
    }
    if (!registered.insert(candidate.display_name).second) {
      plan.skipped.push_back({candidate, SkipReason::kAlreadyPresent});
      continue;
    }
    pending.emplace_back(candidate, std::move(*file_type));
  }

  if (pending.empty()) {
    return plan;
  }

  const auto&            phase    = ResolveBuildPhase(descriptor);
  const auto&            fallback = ResolveFallbackGroup(descriptor);
  const auto             role     = model::PhaseRole(phase.isa);
  const model::GroupTree tree(descriptor);

  auto taken    = descriptor.Identifiers();
  auto allocate = [&]() {
    auto id = ids_->Next(taken);
    taken.insert(id);
    return id;
  };

  std::map<std::string, model::ObjectId> created_groups; // directory -> new group

  auto existing = [&](const std::string& directory) -> std::optional<Destination> {
    if (auto it = created_groups.find(directory); it != created_groups.end()) return Destination{it->second, directory};
    if (const auto* group = tree.FindByDirectory(directory)) return Destination{RequireChildrenList(*group).id, directory};
    return std::nullopt;
  };

  // One group per missing component, below the deepest existing ancestor.
  auto create = [&](const std::string& directory) -> std::optional<Destination> {
    std::vector<std::string>   missing; // deepest first
    std::string                prefix = directory;
    std::optional<Destination> parent;
    while (!parent && !prefix.empty()) {
      const auto slash = prefix.find_last_of('/');
      missing.push_back(slash == std::string::npos ? prefix : prefix.substr(slash + 1));
      prefix = slash == std::string::npos ? std::string() : prefix.substr(0, slash);
      parent = existing(prefix);
    }
    if (!parent) return std::nullopt;

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
      model::Group group;
      group.id          = allocate();
      group.path        = *it;
      group.source_tree = kGroupTree;

      plan.operations.push_back(AddGroup{group});
      plan.operations.push_back(AppendGroupChild{parent->group, group.id});

      const auto child_directory = parent->directory->empty() ? *it : *parent->directory + "/" + *it;
      created_groups.emplace(child_directory, group.id);
      parent = Destination{group.id, child_directory};
    }
    return parent;
  };

  for (const auto& [candidate, file_type] : pending) {
    const auto placement = Locate(candidate);

    std::optional<Destination> destination;
    if (!placement.directory.empty()) {
      destination = existing(placement.directory);
      if (!destination && options_.create_missing_groups) destination = create(placement.directory);
    }
    if (!destination) {
      destination = Destination{RequireChildrenList(fallback).id, tree.DirectoryOf(fallback.id)};
    }

    model::FileReference ref;
    ref.id        = allocate();
    ref.file_type = file_type;
    if (destination->directory) {
      ref.path        = model::GroupTree::RelativeTo(placement.path, *destination->directory);
      ref.source_tree = kGroupTree;
    } else {
      ref.path        = placement.path;
      ref.source_tree = kSourceRoot;
    }
    if (ref.DisplayName() != candidate.display_name) ref.name = candidate.display_name;

    model::BuildFile build_file;
    build_file.id           = allocate();
    build_file.display_name = candidate.display_name + " in " + role;
    build_file.file_ref     = ref.id;

    plan.operations.push_back(AddFileReference{ref});
    plan.operations.push_back(AddBuildActionEntry{build_file});
    plan.operations.push_back(AppendGroupChild{destination->group, ref.id});
    plan.operations.push_back(AppendBuildPhaseEntry{phase.id, build_file.id});
    plan.added.push_back(candidate);
  }

  PBXPATCH_LOG_DEBUG("Planned registration", {observability::IntField("files", static_cast<std::int64_t>(plan.added.size())),
                                              observability::IntField("operations", static_cast<std::int64_t>(plan.operations.size())),
                                              observability::IntField("skipped", static_cast<std::int64_t>(plan.skipped.size()))});
  return plan;
}

} // namespace pbxpatch::core
