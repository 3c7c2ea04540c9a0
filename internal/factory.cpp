#include "factory.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/mutation_planner.hpp"
#include "internal/discovery/source_types.hpp"
#include "internal/storage/file_descriptor_store.hpp"
#include "internal/toolchain/process_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/object_id.hpp"

namespace pbxpatch::factory {

using pbxpatch::runtime::config::RuntimeConfig;

namespace {

void SetIfEmpty(std::string* field, const std::string& value) {
  if (field->empty()) *field = value;
}

discovery::SourceTypeRegistry BuildSourceTypes(const RuntimeConfig& config) {
  const auto& configured = config.registration().source_types();
  if (configured.empty()) {
    return discovery::SourceTypeRegistry::Defaults();
  }

  std::vector<discovery::SourceType> types;
  for (const auto& type : configured) {
    types.push_back({type.extension(), type.file_type()});
  }
  try {
    return discovery::SourceTypeRegistry(std::move(types));
  } catch (const std::invalid_argument& e) {
    throw util::InvalidConfig(std::string("registration.source_types: ") + e.what());
  }
}

} // namespace

RuntimeConfig ResolveDefaults(RuntimeConfig config) {
  auto* project = config.mutable_project();
  if (project->descriptor_path().empty()) {
    throw util::InvalidConfig("project.descriptor_path is required");
  }

  // <root>/App.xcodeproj/project.pbxproj
  const std::filesystem::path descriptor(project->descriptor_path());
  const auto                  bundle = descriptor.parent_path();
  auto                        root   = bundle.parent_path();
  if (root.empty()) root = ".";

  SetIfEmpty(project->mutable_source_root(), root.string());
  if (project->excluded_directories().empty()) {
    for (const auto& name : discovery::SourceScanner::DefaultExcludedDirectories()) {
      project->add_excluded_directories(name);
    }
  }

  auto* build = config.mutable_build();
  SetIfEmpty(build->mutable_project_path(), bundle.string());
  SetIfEmpty(build->mutable_configuration(), "Debug");
  SetIfEmpty(build->mutable_derived_data_path(), (root / "build").string());
  SetIfEmpty(build->mutable_scheme(), config.registration().target_name());

  auto* simulator = config.mutable_simulator();
  SetIfEmpty(simulator->mutable_app_name(), build->scheme());
  SetIfEmpty(simulator->mutable_log_directory(), (root / "logs").string());
  SetIfEmpty(simulator->mutable_screenshot_directory(), (root / "screenshots").string());

  return config;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<toolchain::CommandRunner> runner) {
  Application app;
  app.config = ResolveDefaults(config);

  const auto& project      = app.config.project();
  const auto& registration = app.config.registration();
  auto        types        = BuildSourceTypes(app.config);

  // ------------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------------
  discovery::ScanOptions scan;
  scan.root = project.source_root();
  scan.excluded_directories.assign(project.excluded_directories().begin(), project.excluded_directories().end());
  app.scanner = std::make_shared<discovery::SourceScanner>(std::move(scan), types);

  // ------------------------------------------------------------------
  // Registration
  // ------------------------------------------------------------------
  core::PlannerOptions options;
  options.target_name           = registration.target_name();
  options.default_group         = registration.default_group();
  options.create_missing_groups = registration.create_missing_groups();

  auto store   = std::make_shared<storage::FileDescriptorStore>(project.descriptor_path());
  auto planner = core::MutationPlanner(std::move(options), std::move(types), std::make_shared<util::ObjectIdGenerator>());
  app.pipeline = std::make_shared<core::RegistrationPipeline>(std::move(store), std::move(planner));

  // ------------------------------------------------------------------
  // Toolchain
  // ------------------------------------------------------------------
  if (!runner) runner = std::make_shared<toolchain::ProcessRunner>();

  const auto&              build_config = app.config.build();
  toolchain::BuildSettings build;
  build.project_path      = build_config.project_path();
  build.scheme            = build_config.scheme();
  build.configuration     = build_config.configuration();
  build.derived_data_path = build_config.derived_data_path();

  const auto&                  simulator_config = app.config.simulator();
  toolchain::SimulatorSettings simulator;
  simulator.device_id            = simulator_config.device_id();
  simulator.bundle_id            = simulator_config.bundle_id();
  simulator.app_name             = simulator_config.app_name();
  simulator.log_directory        = simulator_config.log_directory();
  simulator.screenshot_directory = simulator_config.screenshot_directory();

  app.orchestrator = std::make_shared<toolchain::BuildOrchestrator>(std::move(runner), std::move(build), std::move(simulator));

  return app;
}

} // namespace pbxpatch::factory
