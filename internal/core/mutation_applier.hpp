#pragma once

#include "internal/core/integrity_checker.hpp"
#include "internal/core/mutation_plan.hpp"
#include "internal/model/descriptor.hpp"

namespace pbxpatch::core {

/*
  MutationApplier

  Applies a plan all-or-nothing. Every operation is checked against the
  working copy before it runs; afterwards the working copy must not show
  any integrity violation the input did not already have.

  Throws util::ReferentialIntegrityViolation. On any exception the
  caller's descriptor is left exactly as it was.
*/
class MutationApplier {
 public:
  void Apply(model::Descriptor& descriptor, const MutationPlan& plan) const;

 private:
  IntegrityChecker checker_;
};

} // namespace pbxpatch::core
