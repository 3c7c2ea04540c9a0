#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/group_tree.hpp"
#include "internal/pbxproj/descriptor_reader.hpp"
#include "internal/util/errors.hpp"
#include "tests/common/sample_descriptor.hpp"
#include "tests/common/text_edit.hpp"

namespace {

namespace fs = std::filesystem;

struct Workspace {
  fs::path root;
  fs::path descriptor;
  fs::path config;
};

void WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

Workspace MakeWorkspace(const std::string& test_name, const std::string& descriptor_text, const std::string& registration_yaml) {
  Workspace ws;
  ws.root = fs::temp_directory_path() / "pbxpatch_register_sources_tests" / test_name;
  fs::remove_all(ws.root);

  ws.descriptor = ws.root / "DemoApp.xcodeproj" / "project.pbxproj";
  WriteFile(ws.descriptor, descriptor_text);

  WriteFile(ws.root / "App" / "AppDelegate.swift", "import UIKit\n");
  WriteFile(ws.root / "App" / "Info.plist", "<plist/>\n");
  WriteFile(ws.root / "App" / "SettingsView.swift", "import SwiftUI\n");
  WriteFile(ws.root / "Features" / "Chat" / "ChatView.swift", "import SwiftUI\n");
  WriteFile(ws.root / "Features" / "Chat" / "ChatModel.swift", "import Foundation\n");
  WriteFile(ws.root / "Sources" / "Net" / "Client.swift", "import Foundation\n");
  WriteFile(ws.root / "Pods" / "Alamofire" / "Session.swift", "import Foundation\n");
  WriteFile(ws.root / "build" / "Intermediates" / "Generated.swift", "// generated\n");

  ws.config = ws.root / "pbxpatch.yaml";
  WriteFile(ws.config, "logging:\n  level: warn\nproject:\n  descriptor_path: \"" + ws.descriptor.string() + "\"\nregistration:\n  target_name: DemoApp\n" +
                           registration_yaml);
  return ws;
}

pbxpatch::factory::Application Load(const Workspace& ws) {
  return pbxpatch::factory::Build(pbxpatch::config::ConfigLoader::LoadFromYaml(ws.config.string()));
}

// Every line of `before` appears in `after`, in the same order.
bool KeepsAllLines(const std::string& before, const std::string& after) {
  std::istringstream old_lines(before);
  std::istringstream new_lines(after);
  std::string        old_line;
  std::string        new_line;
  while (std::getline(old_lines, old_line)) {
    bool found = false;
    while (std::getline(new_lines, new_line)) {
      if (new_line == old_line) {
        found = true;
        break;
      }
    }
    if (!found) return false;
  }
  return true;
}

// Every reference the run added resolves, through its groups, to a file under the root.
std::size_t AssertNewRefsPointAtFiles(const pbxpatch::model::Descriptor& descriptor, const fs::path& root) {
  const auto                       original = pbxpatch::pbxproj::DescriptorReader::Read(pbxpatch::testing::kSampleDescriptor).Identifiers();
  const pbxpatch::model::GroupTree tree(descriptor);
  std::size_t                      checked = 0;
  for (const auto& ref : descriptor.FileReferences().All()) {
    if (original.contains(ref.id)) continue;
    const auto location = tree.Locate(ref);
    assert(location);
    assert(fs::is_regular_file(root / *location));
    ++checked;
  }
  return checked;
}

void TestScanAndRegister() {
  const auto ws  = MakeWorkspace("scan", pbxpatch::testing::kSampleDescriptor, "");
  auto       app = Load(ws);

  const auto report = app.pipeline->Register(app.scanner->Scan());
  assert(report.written);
  assert(report.added.size() == 3);
  assert(report.added[0].relative_path == "App/SettingsView.swift");
  assert(report.added[1].relative_path == "Features/Chat/ChatModel.swift");
  assert(report.added[2].relative_path == "Sources/Net/Client.swift");
  assert(report.skipped.size() == 2);

  const auto updated = ReadFile(ws.descriptor);
  assert(KeepsAllLines(pbxpatch::testing::kSampleDescriptor, updated));
  assert(updated.find("/* ChatModel.swift in Sources */ = {isa = PBXBuildFile; fileRef = ") != std::string::npos);
  assert(updated.find("path = Sources/Net/Client.swift; sourceTree = \"<group>\"; };") != std::string::npos);
  assert(!fs::exists(ws.descriptor.string() + ".tmp"));

  const auto descriptor = pbxpatch::pbxproj::DescriptorReader::Read(updated);
  assert(descriptor.FileReferences().Size() == 8);
  assert(descriptor.BuildPhases().Find(pbxpatch::testing::kSourcesPhaseId)->files.ids.size() == 5);
  assert(descriptor.Groups().Find(pbxpatch::testing::kChatGroupId)->children.ids.size() == 2);
  assert(AssertNewRefsPointAtFiles(descriptor, ws.root) == 3);
  assert(app.pipeline->Verify().empty());

  // second run over the same tree changes nothing
  auto       again  = Load(ws);
  const auto rerun  = again.pipeline->Register(again.scanner->Scan());
  assert(!rerun.written);
  assert(rerun.added.empty());
  assert(ReadFile(ws.descriptor) == updated);
}

void TestExplicitPathsAndDryRun() {
  const auto ws  = MakeWorkspace("explicit", pbxpatch::testing::kSampleDescriptor, "");
  auto       app = Load(ws);

  const auto candidates = app.scanner->FromPaths({(ws.root / "App" / "SettingsView.swift").string(), "Features/Chat/ChatModel.swift"});
  const auto preview    = app.pipeline->Register(candidates, true);
  assert(!preview.written);
  assert(preview.operations.size() == 8);
  assert(ReadFile(ws.descriptor) == pbxpatch::testing::kSampleDescriptor);

  const auto report = app.pipeline->Register(candidates);
  assert(report.written);
  assert(report.added.size() == 2);
}

void TestPathsOutsideTheRootAreSkipped() {
  const auto ws  = MakeWorkspace("outside", pbxpatch::testing::kSampleDescriptor, "");
  auto       app = Load(ws);

  const auto outside = ws.root.parent_path() / "outside_shared" / "Shared.swift";
  WriteFile(outside, "import Foundation\n");

  const auto report = app.pipeline->Register(app.scanner->FromPaths({outside.string()}));
  assert(!report.written);
  assert(report.added.empty());
  assert(report.skipped.size() == 1);
  assert(report.skipped[0].reason == pbxpatch::core::SkipReason::kOutsideSourceRoot);
  assert(ReadFile(ws.descriptor) == pbxpatch::testing::kSampleDescriptor);
}

void TestMalformedDescriptorIsLeftAlone() {
  const auto broken = pbxpatch::testing::ReplaceOnce(pbxpatch::testing::kSampleDescriptor, "/* End PBXSourcesBuildPhase section */\n", "");
  const auto ws     = MakeWorkspace("malformed", broken, "");
  auto       app    = Load(ws);

  bool threw = false;
  try {
    app.pipeline->Register(app.scanner->Scan());
  } catch (const pbxpatch::util::MalformedDescriptor&) {
    threw = true;
  }
  assert(threw);
  assert(ReadFile(ws.descriptor) == broken);
}

void TestCreateMissingGroups() {
  const auto ws  = MakeWorkspace("groups", pbxpatch::testing::kSampleDescriptor, "  create_missing_groups: true\n");
  auto       app = Load(ws);

  const auto report = app.pipeline->Register(app.scanner->Scan());
  assert(report.written);
  assert(report.added.size() == 3);

  const auto                       descriptor = pbxpatch::pbxproj::DescriptorReader::Read(ReadFile(ws.descriptor));
  const pbxpatch::model::GroupTree tree(descriptor);

  // Sources/Net becomes Sources under the main group and Net under it
  const auto* sources = tree.FindByDirectory("Sources");
  const auto* net     = tree.FindByDirectory("Sources/Net");
  assert(sources && net);
  assert(sources->path == "Sources");
  assert(net->path == "Net");
  assert(tree.ParentOf(net->id) == sources);
  assert(sources->children.ids.size() == 1 && sources->children.ids[0] == net->id);
  assert(net->children.ids.size() == 1);
  assert(descriptor.FileReferences().Find(net->children.ids[0])->path == "Client.swift");

  const auto& main_children = descriptor.Groups().Find(pbxpatch::testing::kMainGroupId)->children.ids;
  assert(main_children.back() == sources->id);
  assert(AssertNewRefsPointAtFiles(descriptor, ws.root) == 3);
  assert(app.pipeline->Verify().empty());
}

} // namespace

int main() {
  TestScanAndRegister();
  TestExplicitPathsAndDryRun();
  TestPathsOutsideTheRootAreSkipped();
  TestMalformedDescriptorIsLeftAlone();
  TestCreateMissingGroups();

  std::cout << "pbxpatch_integration_register_sources: pass\n";
  return 0;
}
