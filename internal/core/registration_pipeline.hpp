#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/integrity_checker.hpp"
#include "internal/core/mutation_applier.hpp"
#include "internal/core/mutation_planner.hpp"
#include "internal/discovery/source_candidate.hpp"
#include "internal/storage/descriptor_store.hpp"

namespace pbxpatch::core {

struct RegistrationReport {
  std::vector<discovery::SourceCandidate> added;
  std::vector<SkippedCandidate>           skipped;
  std::vector<std::string>                operations; // Describe() of each planned operation
  bool                                    written = false;
};

/*
  RegistrationPipeline

  read -> plan -> apply -> write, once per call, against a
  DescriptorStore. Nothing is written when the plan is empty, in dry-run
  mode, or when any stage throws.
*/
class RegistrationPipeline {
 public:
  RegistrationPipeline(std::shared_ptr<storage::DescriptorStore> store, MutationPlanner planner);

  RegistrationReport Register(const std::vector<discovery::SourceCandidate>& candidates, bool dry_run = false);

  // Dangling or duplicated references in the stored descriptor.
  std::vector<Violation> Verify();

 private:
  std::shared_ptr<storage::DescriptorStore> store_;
  MutationPlanner                           planner_;
  MutationApplier                           applier_;
  IntegrityChecker                          checker_;
};

} // namespace pbxpatch::core
