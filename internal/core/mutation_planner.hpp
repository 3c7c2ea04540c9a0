#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/mutation_plan.hpp"
#include "internal/discovery/source_candidate.hpp"
#include "internal/discovery/source_types.hpp"
#include "internal/model/descriptor.hpp"
#include "internal/util/object_id.hpp"

namespace pbxpatch::core {

struct PlannerOptions {
  // Target whose sources phase receives new files. Empty: first sources phase.
  std::string target_name;
  // Group that receives files with no matching directory group. Empty: main group.
  std::string default_group;
  bool        create_missing_groups = false;
};

/*
  MutationPlanner

  Decides which candidates are missing from a descriptor and computes the
  records and cross-references that register them.

  Membership is by display name only: a candidate is already registered
  if any file reference has the same base name, wherever it lives.

  A file goes to the group whose resolved directory (the `<group>` paths
  summed from mainGroup) equals its folder. With create_missing_groups,
  the missing folders become one group per path component below the
  deepest existing ancestor. Otherwise it goes to the fallback group.
  The new reference's path is relative to the group it lands in, or
  SOURCE_ROOT-relative when that group's directory is unknown.
  Candidates outside the source root are skipped.

  Throws util::AnchorNotFound when the build phase or the fallback group
  cannot be located, or when a receiving group has no children list.
  No partial plan is ever returned.
*/
class MutationPlanner {
 public:
  MutationPlanner(PlannerOptions options, discovery::SourceTypeRegistry types, std::shared_ptr<util::ObjectIdGenerator> ids);

  MutationPlan Plan(const model::Descriptor& descriptor, const std::vector<discovery::SourceCandidate>& candidates) const;

 private:
  const model::BuildPhase& ResolveBuildPhase(const model::Descriptor& descriptor) const;
  const model::Group&      ResolveFallbackGroup(const model::Descriptor& descriptor) const;

  PlannerOptions                           options_;
  discovery::SourceTypeRegistry            types_;
  std::shared_ptr<util::ObjectIdGenerator> ids_;
};

} // namespace pbxpatch::core
