#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/mutation_applier.hpp"
#include "internal/core/mutation_planner.hpp"
#include "internal/discovery/source_types.hpp"
#include "internal/pbxproj/descriptor_reader.hpp"
#include "internal/pbxproj/descriptor_writer.hpp"
#include "internal/util/object_id.hpp"

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

int main(int argc, char** argv) {
  // Prints the operations and the resulting descriptor for a set of
  // files, without touching the project on disk.
  if (argc < 3) {
    std::cerr << "Usage: plan_preview_example <project.pbxproj> <relative/path.swift>...\n";
    return 1;
  }

  try {
    auto descriptor = pbxpatch::pbxproj::DescriptorReader::Read(ReadFile(argv[1]));

    std::vector<pbxpatch::discovery::SourceCandidate> candidates;
    for (int i = 2; i < argc; ++i) {
      const std::string path = argv[i];
      const auto        slash = path.find_last_of('/');
      candidates.push_back({slash == std::string::npos ? path : path.substr(slash + 1), path});
    }

    pbxpatch::core::MutationPlanner planner({}, pbxpatch::discovery::SourceTypeRegistry::Defaults(),
                                            std::make_shared<pbxpatch::util::ObjectIdGenerator>());
    auto plan = planner.Plan(descriptor, candidates);

    for (const auto& skipped : plan.skipped) {
      std::cout << "skip " << skipped.candidate.relative_path << ": " << pbxpatch::core::ToString(skipped.reason) << '\n';
    }
    for (const auto& operation : plan.operations) {
      std::cout << pbxpatch::core::Describe(operation) << '\n';
    }
    if (plan.Empty()) {
      std::cout << "descriptor already registers every file\n";
      return 0;
    }

    pbxpatch::core::MutationApplier().Apply(descriptor, plan);
    std::cout << "\n" << pbxpatch::pbxproj::DescriptorWriter::Write(descriptor);
  } catch (const std::exception& e) {
    std::cerr << "preview failed: " << e.what() << '\n';
    return 2;
  }
  return 0;
}
