#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/toolchain/command_runner.hpp"

namespace pbxpatch::toolchain {

struct BuildSettings {
  std::string project_path; // path to the .xcodeproj bundle
  std::string scheme;
  std::string configuration = "Debug";
  std::string derived_data_path;
};

struct SimulatorSettings {
  std::string device_id; // simulator UUID
  std::string bundle_id;
  std::string app_name; // product name without ".app"
  std::string log_directory;
  std::string screenshot_directory;
};

/*
  BuildOrchestrator

  Drives xcodebuild and simctl for the configured project and simulator.
  A tool exiting non-zero throws util::ToolFailure carrying the tail of
  its output. Settings a step needs but does not have throw
  util::InvalidConfig before anything runs.
*/
class BuildOrchestrator {
 public:
  BuildOrchestrator(std::shared_ptr<CommandRunner> runner, BuildSettings build, SimulatorSettings simulator);

  void Build();

  // Already booted devices are fine.
  void BootSimulator();

  void Install();
  void Launch();

  // Returns the file written. Default: <screenshot_directory>/screenshot_<timestamp>.png
  std::filesystem::path Screenshot(std::optional<std::filesystem::path> output = std::nullopt);

  // Recent app logs written to <log_directory>/simulator_<timestamp>.log
  std::filesystem::path CaptureLogs();

  // <derived data>/Build/Products/<configuration>-iphonesimulator/<app>.app
  std::filesystem::path AppBundlePath() const;

 private:
  CommandResult RunChecked(const std::vector<std::string>& argv, const std::string& step);
  void          Require(const std::string& value, const std::string& field) const;

  std::shared_ptr<CommandRunner> runner_;
  BuildSettings                  build_;
  SimulatorSettings              simulator_;
};

// Last `lines` lines of tool output.
std::string OutputTail(const std::string& output, std::size_t lines = 20);

} // namespace pbxpatch::toolchain
