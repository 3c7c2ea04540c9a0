#include "internal/discovery/source_scanner.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using pbxpatch::discovery::ScanOptions;
using pbxpatch::discovery::SourceScanner;
using pbxpatch::discovery::SourceTypeRegistry;

fs::path FreshRoot(const std::string& test_name) {
  const auto root = fs::temp_directory_path() / "pbxpatch_source_scanner_tests" / test_name;
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

void Touch(const fs::path& root, const std::string& relative) {
  const auto path = root / relative;
  fs::create_directories(path.parent_path());
  std::ofstream(path) << "// " << relative << "\n";
}

SourceScanner MakeScanner(const fs::path& root) {
  return SourceScanner({root, SourceScanner::DefaultExcludedDirectories()}, SourceTypeRegistry::Defaults());
}

void TestRegistry() {
  const auto types = SourceTypeRegistry::Defaults();
  assert(types.FileTypeFor("AppDelegate.swift") == std::optional<std::string>("sourcecode.swift"));
  assert(types.FileTypeFor("Bridge.MM") == std::optional<std::string>("sourcecode.cpp.objcpp"));
  assert(types.FileTypeFor("archive.tar.c") == std::optional<std::string>("sourcecode.c.c"));
  assert(!types.FileTypeFor("Info.plist"));
  assert(!types.FileTypeFor(".swift"));
  assert(!types.FileTypeFor("swift"));
  assert(!types.IsSource("Header.h"));

  const SourceTypeRegistry custom({{"metal", "sourcecode.metal"}, {".H", "sourcecode.c.h"}});
  assert(custom.FileTypeFor("Shaders.metal") == std::optional<std::string>("sourcecode.metal"));
  assert(custom.FileTypeFor("Bridge.h") == std::optional<std::string>("sourcecode.c.h"));
  assert(!custom.IsSource("Main.swift"));

  bool threw = false;
  try {
    SourceTypeRegistry(std::vector<pbxpatch::discovery::SourceType>{{"", "sourcecode.swift"}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SourceTypeRegistry(std::vector<pbxpatch::discovery::SourceType>{{".swift", ""}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestScanFindsSourcesSorted() {
  const auto root = FreshRoot("sorted");
  Touch(root, "Sources/Net/Client.swift");
  Touch(root, "App/AppDelegate.swift");
  Touch(root, "App/Bridge.mm");
  Touch(root, "App/Info.plist");
  Touch(root, "main.c");
  Touch(root, "README.md");

  const auto candidates = MakeScanner(root).Scan();
  assert(candidates.size() == 4);
  assert(candidates[0].relative_path == "App/AppDelegate.swift");
  assert(candidates[0].display_name == "AppDelegate.swift");
  assert(candidates[1].relative_path == "App/Bridge.mm");
  assert(candidates[2].relative_path == "Sources/Net/Client.swift");
  assert(candidates[2].display_name == "Client.swift");
  assert(candidates[3].relative_path == "main.c");
}

void TestScanSkipsExcludedDirectories() {
  const auto root = FreshRoot("excluded");
  Touch(root, "App/Kept.swift");
  Touch(root, ".build/Hidden.swift");
  Touch(root, "build/Generated.swift");
  Touch(root, "Pods/Alamofire/Request.swift");
  Touch(root, "DerivedData/Foo/Bar.swift");
  Touch(root, "DemoApp.xcodeproj/Template.swift");
  Touch(root, "DemoApp.xcworkspace/Template.swift");
  Touch(root, "App/Nested/build/Deep.swift");

  const auto candidates = MakeScanner(root).Scan();
  assert(candidates.size() == 1);
  assert(candidates[0].relative_path == "App/Kept.swift");

  const SourceScanner custom({root, {"App"}}, SourceTypeRegistry::Defaults());
  const auto          others = custom.Scan();
  assert(others.size() == 3);
  for (const auto& candidate : others) {
    assert(candidate.relative_path.rfind("App/", 0) != 0);
    assert(candidate.relative_path.front() != '.');
  }
}

void TestScanMissingRoot() {
  const auto root = FreshRoot("missing") / "nope";
  bool       threw = false;
  try {
    MakeScanner(root).Scan();
  } catch (const pbxpatch::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestFromPaths() {
  const auto root = FreshRoot("from_paths");
  Touch(root, "App/Existing.swift");

  const auto scanner    = MakeScanner(root);
  const auto candidates = scanner.FromPaths({(root / "App/Existing.swift").string(), "App/NotYetWritten.swift", "Notes.txt"});

  assert(candidates.size() == 3);
  assert(candidates[0].display_name == "Existing.swift");
  assert(candidates[0].relative_path == "App/Existing.swift");
  assert(candidates[1].display_name == "NotYetWritten.swift");
  assert(candidates[1].relative_path == "App/NotYetWritten.swift");
  // type filtering is left to the planner
  assert(candidates[2].display_name == "Notes.txt");
  assert(candidates[2].relative_path == "Notes.txt");
}

} // namespace

int main() {
  TestRegistry();
  TestScanFindsSourcesSorted();
  TestScanSkipsExcludedDirectories();
  TestScanMissingRoot();
  TestFromPaths();

  std::cout << "pbxpatch_unit_source_scanner: pass\n";
  return 0;
}
