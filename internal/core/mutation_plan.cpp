#include "mutation_plan.hpp"

namespace pbxpatch::core {

std::string Describe(const Operation& operation) {
  if (const auto* op = std::get_if<AddFileReference>(&operation)) {
    return "add file reference " + op->record.id + " (" + op->record.DisplayName() + ")";
  }
  if (const auto* op = std::get_if<AddBuildActionEntry>(&operation)) {
    return "add build file " + op->record.id + " (" + op->record.display_name + ")";
  }
  if (const auto* op = std::get_if<AddGroup>(&operation)) {
    return "add group " + op->record.id + " (" + op->record.DisplayName() + ")";
  }
  if (const auto* op = std::get_if<AppendGroupChild>(&operation)) {
    return "append " + op->child + " to group " + op->group;
  }
  const auto& op = std::get<AppendBuildPhaseEntry>(operation);
  return "append " + op.build_file + " to build phase " + op.phase;
}

const char* ToString(SkipReason reason) {
  switch (reason) {
    case SkipReason::kAlreadyPresent:
      return "already present";
    case SkipReason::kUnrecognizedType:
      return "unrecognized type";
    case SkipReason::kOutsideSourceRoot:
      return "outside source root";
  }
  return "unknown";
}

} // namespace pbxpatch::core
