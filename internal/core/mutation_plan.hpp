#pragma once

#include <string>
#include <variant>
#include <vector>

#include "internal/discovery/source_candidate.hpp"
#include "internal/model/records.hpp"

namespace pbxpatch::core {

struct AddFileReference {
  model::FileReference record;
};

struct AddBuildActionEntry {
  model::BuildFile record;
};

struct AddGroup {
  model::Group record;
};

struct AppendGroupChild {
  model::ObjectId group;
  model::ObjectId child;
};

struct AppendBuildPhaseEntry {
  model::ObjectId phase;
  model::ObjectId build_file;
};

using Operation = std::variant<AddFileReference, AddBuildActionEntry, AddGroup, AppendGroupChild, AppendBuildPhaseEntry>;

std::string Describe(const Operation& operation);

enum class SkipReason {
  kAlreadyPresent,
  kUnrecognizedType,
  kOutsideSourceRoot,
};

const char* ToString(SkipReason reason);

struct SkippedCandidate {
  discovery::SourceCandidate candidate;
  SkipReason                 reason;
};

/*
  MutationPlan

  Operations are ordered so that every record exists before anything
  references it. `added` and `skipped` are informational.
*/
struct MutationPlan {
  std::vector<Operation>                  operations;
  std::vector<discovery::SourceCandidate> added;
  std::vector<SkippedCandidate>           skipped;

  bool Empty() const {
    return operations.empty();
  }
};

} // namespace pbxpatch::core
