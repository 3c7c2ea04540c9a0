#include "registration_pipeline.hpp"

#include <cstdint>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/pbxproj/descriptor_reader.hpp"
#include "internal/pbxproj/descriptor_writer.hpp"

namespace pbxpatch::core {

RegistrationPipeline::RegistrationPipeline(std::shared_ptr<storage::DescriptorStore> store, MutationPlanner planner)
    : store_(std::move(store)), planner_(std::move(planner)) {
  if (!store_) {
    throw std::invalid_argument("RegistrationPipeline requires a descriptor store");
  }
}

RegistrationReport RegistrationPipeline::Register(const std::vector<discovery::SourceCandidate>& candidates, bool dry_run) {
  auto descriptor = pbxproj::DescriptorReader::Read(store_->ReadAll());
  auto plan       = planner_.Plan(descriptor, candidates);

  RegistrationReport report;
  report.added   = plan.added;
  report.skipped = plan.skipped;
  for (const auto& operation : plan.operations) {
    report.operations.push_back(Describe(operation));
  }

  for (const auto& skipped : plan.skipped) {
    PBXPATCH_LOG_INFO("Skipped source file", {observability::StringField("file", skipped.candidate.relative_path),
                                              observability::StringField("reason", ToString(skipped.reason))});
  }

  if (plan.Empty()) {
    PBXPATCH_LOG_INFO("Descriptor already up to date", {observability::StringField("descriptor", store_->Describe())});
    return report;
  }

  applier_.Apply(descriptor, plan);
  auto text = pbxproj::DescriptorWriter::Write(descriptor);

  if (dry_run) {
    PBXPATCH_LOG_INFO("Dry run, descriptor not written", {observability::IntField("operations", static_cast<std::int64_t>(plan.operations.size()))});
    return report;
  }

  store_->ReplaceAll(text);
  report.written = true;

  for (const auto& added : plan.added) {
    PBXPATCH_LOG_INFO("Registered source file", {observability::StringField("file", added.relative_path)});
  }
  PBXPATCH_LOG_INFO("Descriptor updated", {observability::StringField("descriptor", store_->Describe()),
                                           observability::IntField("files", static_cast<std::int64_t>(plan.added.size()))});
  return report;
}

std::vector<Violation> RegistrationPipeline::Verify() {
  auto descriptor = pbxproj::DescriptorReader::Read(store_->ReadAll());
  auto violations = checker_.Check(descriptor);

  for (const auto& violation : violations) {
    PBXPATCH_LOG_WARN("Integrity violation", {observability::StringField("owner", violation.owner), observability::StringField("field", violation.field),
                                              observability::StringField("target", violation.target),
                                              observability::StringField("reason", violation.reason)});
  }
  return violations;
}

} // namespace pbxpatch::core
