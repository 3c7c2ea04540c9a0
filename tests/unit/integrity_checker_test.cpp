#include "internal/core/integrity_checker.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/pbxproj/descriptor_reader.hpp"
#include "tests/common/sample_descriptor.hpp"
#include "tests/common/text_edit.hpp"

namespace {

using pbxpatch::core::IntegrityChecker;
using pbxpatch::core::Violation;
using pbxpatch::pbxproj::DescriptorReader;
using pbxpatch::testing::kSampleDescriptor;
using pbxpatch::testing::ReplaceOnce;

std::vector<Violation> CheckText(const std::string& text) {
  return IntegrityChecker().Check(DescriptorReader::Read(text));
}

void TestSampleIsClean() {
  // includes a build file whose fileRef is a PBXVariantGroup
  assert(CheckText(kSampleDescriptor).empty());
}

void TestDanglingGroupChild() {
  const auto text = ReplaceOnce(kSampleDescriptor, "\t\t\t\t1D0000000000000000000024 /* DemoApp.app */,\n",
                                "\t\t\t\t1D0000000000000000000024 /* DemoApp.app */,\n\t\t\t\t1D0000000000000000000099 /* Gone.swift */,\n");

  const auto violations = CheckText(text);
  assert(violations.size() == 1);
  assert((violations[0] == Violation{pbxpatch::testing::kProductsGroupId, "children", "1D0000000000000000000099", "missing"}));
  assert(violations[0].ToString() == "1D0000000000000000000014.children -> 1D0000000000000000000099: missing");
}

void TestGroupChildOfWrongKind() {
  const auto text = ReplaceOnce(kSampleDescriptor, "\t\t\t\t1D0000000000000000000021 /* ChatView.swift */,\n",
                                "\t\t\t\t1D0000000000000000000021 /* ChatView.swift */,\n\t\t\t\t1D0000000000000000000031 /* ChatView.swift in Sources */,\n");

  const auto violations = CheckText(text);
  assert(violations.size() == 1);
  assert(violations[0].owner == pbxpatch::testing::kChatGroupId);
  assert(violations[0].reason == "not a file reference or group (PBXBuildFile)");
}

void TestBuildFilePointingAtGroup() {
  const auto text = ReplaceOnce(kSampleDescriptor, "fileRef = 1D0000000000000000000020 /* AppDelegate.swift */", "fileRef = 1D0000000000000000000011 /* App */");

  const auto violations = CheckText(text);
  assert(violations.size() == 1);
  assert(violations[0].owner == "1D0000000000000000000030");
  assert(violations[0].field == "fileRef");
  assert(violations[0].target == pbxpatch::testing::kAppGroupId);
  assert(violations[0].reason == "not a file reference (PBXGroup)");
}

void TestDanglingFileRef() {
  const auto text = ReplaceOnce(kSampleDescriptor, "fileRef = 1D0000000000000000000021 /* ChatView.swift */", "fileRef = 1D0000000000000000000098 /* ChatView.swift */");

  const auto violations = CheckText(text);
  assert(violations.size() == 1);
  assert((violations[0] == Violation{"1D0000000000000000000031", "fileRef", "1D0000000000000000000098", "missing"}));
}

void TestPhaseListingFileReference() {
  const auto text = ReplaceOnce(kSampleDescriptor, "\t\t\t\t1D0000000000000000000031 /* ChatView.swift in Sources */,\n",
                                "\t\t\t\t1D0000000000000000000021 /* ChatView.swift */,\n");

  const auto violations = CheckText(text);
  assert(violations.size() == 1);
  assert(violations[0].owner == pbxpatch::testing::kSourcesPhaseId);
  assert(violations[0].field == "files");
  assert(violations[0].reason == "not a build file (PBXFileReference)");
}

void TestSecondBuildFileForSameReference() {
  const auto text = ReplaceOnce(kSampleDescriptor, "fileRef = 1D0000000000000000000021 /* ChatView.swift */", "fileRef = 1D0000000000000000000020 /* AppDelegate.swift */");

  const auto violations = CheckText(text);
  assert(violations.size() == 1);
  assert(violations[0].owner == pbxpatch::testing::kSourcesPhaseId);
  assert(violations[0].target == "1D0000000000000000000031");
  assert(violations[0].reason == "second build file for 1D0000000000000000000020");
}

} // namespace

int main() {
  TestSampleIsClean();
  TestDanglingGroupChild();
  TestGroupChildOfWrongKind();
  TestBuildFilePointingAtGroup();
  TestDanglingFileRef();
  TestPhaseListingFileReference();
  TestSecondBuildFileForSameReference();

  std::cout << "pbxpatch_unit_integrity_checker: pass\n";
  return 0;
}
