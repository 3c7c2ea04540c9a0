#include "mutation_applier.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/core/descriptor_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/object_id.hpp"

namespace pbxpatch::core {

namespace {

[[noreturn]] void Reject(const Operation& operation, const std::string& reason) {
  throw util::ReferentialIntegrityViolation(Describe(operation) + ": " + reason);
}

void RequireNewId(const model::Descriptor& working, const Operation& operation, const model::ObjectId& id) {
  if (!util::IsObjectId(id)) Reject(operation, "malformed identifier '" + id + "'");
  if (working.HasObject(id)) Reject(operation, "identifier already in use");
}

void ApplyOne(model::Descriptor& working, const Operation& operation) {
  std::visit(
      [&](const auto& op) {
        using Op = std::decay_t<decltype(op)>;

        if constexpr (std::is_same_v<Op, AddFileReference>) {
          RequireNewId(working, operation, op.record.id);
          working.AddFileReference(op.record);

        } else if constexpr (std::is_same_v<Op, AddBuildActionEntry>) {
          RequireNewId(working, operation, op.record.id);
          if (!op.record.file_ref) Reject(operation, "build file without fileRef");
          const auto info = working.Lookup(*op.record.file_ref);
          if (!info) Reject(operation, "fileRef " + *op.record.file_ref + " does not exist");
          if (info->kind != model::ObjectKind::kFileReference) Reject(operation, "fileRef " + *op.record.file_ref + " is a " + model::ToString(info->kind));
          working.AddBuildFile(op.record);

        } else if constexpr (std::is_same_v<Op, AddGroup>) {
          RequireNewId(working, operation, op.record.id);
          if (!op.record.children.ids.empty()) Reject(operation, "new group must start empty");
          working.AddGroup(op.record);

        } else if constexpr (std::is_same_v<Op, AppendGroupChild>) {
          const auto* group = working.Groups().Find(op.group);
          if (!group) Reject(operation, "group does not exist");
          if (!group->added && group->children.close_offset == model::kNoOffset) Reject(operation, "group has no children list");
          const auto info = working.Lookup(op.child);
          if (!info) Reject(operation, "child does not exist");
          if (info->kind != model::ObjectKind::kFileReference && info->kind != model::ObjectKind::kGroup) {
            Reject(operation, std::string("child is a ") + model::ToString(info->kind));
          }
          if (op.child == op.group) Reject(operation, "group cannot contain itself");
          if (group->children.Contains(op.child)) Reject(operation, "child already listed");
          working.AppendGroupChild(op.group, op.child);

        } else if constexpr (std::is_same_v<Op, AppendBuildPhaseEntry>) {
          const auto* phase = working.BuildPhases().Find(op.phase);
          if (!phase) Reject(operation, "build phase does not exist");
          if (phase->files.close_offset == model::kNoOffset) Reject(operation, "build phase has no files list");
          const auto* build_file = working.BuildFiles().Find(op.build_file);
          if (!build_file) Reject(operation, "build file does not exist");
          if (phase->files.Contains(op.build_file)) Reject(operation, "build file already listed");
          if (build_file->file_ref) {
            const auto& ids       = phase->files.ids;
            const auto  duplicate = std::any_of(ids.begin(), ids.end(), [&](const model::ObjectId& id) {
              const auto* other = working.BuildFiles().Find(id);
              return other && other->file_ref == build_file->file_ref;
            });
            if (duplicate) Reject(operation, "phase already builds " + *build_file->file_ref);
          }
          working.AppendBuildPhaseEntry(op.phase, op.build_file);
        }
      },
      operation);
}

} // namespace

void MutationApplier::Apply(model::Descriptor& descriptor, const MutationPlan& plan) const {
  if (plan.Empty()) return;

  const auto before = checker_.Check(descriptor);

  DescriptorTransaction tx(descriptor);
  for (const auto& operation : plan.operations) {
    ApplyOne(tx.Mutable(), operation);
  }

  for (const auto& violation : checker_.Check(tx.View())) {
    if (std::find(before.begin(), before.end(), violation) == before.end()) {
      throw util::ReferentialIntegrityViolation("mutation introduced " + violation.ToString());
    }
  }

  tx.Commit();
  PBXPATCH_LOG_DEBUG("Applied mutation plan", {observability::IntField("operations", static_cast<std::int64_t>(plan.operations.size()))});
}

} // namespace pbxpatch::core
