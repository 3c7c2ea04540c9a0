#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/registration_pipeline.hpp"
#include "internal/discovery/source_scanner.hpp"
#include "internal/toolchain/build_orchestrator.hpp"
#include "internal/toolchain/command_runner.hpp"

namespace pbxpatch::factory {

/*
  Application

  Everything one CLI run needs, wired from a resolved RuntimeConfig.
*/
struct Application {
  pbxpatch::runtime::config::RuntimeConfig config; // with defaults applied

  std::shared_ptr<core::RegistrationPipeline>   pipeline;
  std::shared_ptr<discovery::SourceScanner>     scanner;
  std::shared_ptr<toolchain::BuildOrchestrator> orchestrator;
};

/*
  Fills empty fields with values derived from project.descriptor_path.
  Throws util::InvalidConfig if descriptor_path is empty.
*/
pbxpatch::runtime::config::RuntimeConfig ResolveDefaults(pbxpatch::runtime::config::RuntimeConfig config);

/*
  Build

  Composition root. The only place that knows the concrete store and
  process runner types. A null runner means ProcessRunner.
*/
Application Build(const pbxpatch::runtime::config::RuntimeConfig& config, std::shared_ptr<toolchain::CommandRunner> runner = nullptr);

} // namespace pbxpatch::factory
