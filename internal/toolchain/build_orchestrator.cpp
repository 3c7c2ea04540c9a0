#include "build_orchestrator.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pbxpatch::toolchain {

namespace {

bool AlreadyBooted(const CommandResult& result) {
  return result.output.find("current state: Booted") != std::string::npos;
}

} // namespace

std::string OutputTail(const std::string& output, std::size_t lines) {
  if (output.empty() || lines == 0) return {};

  auto end = output.size();
  if (output.back() == '\n') --end;

  auto        begin = end;
  std::size_t seen  = 0;
  while (begin > 0) {
    if (output[begin - 1] == '\n' && ++seen == lines) break;
    --begin;
  }
  return output.substr(begin, end - begin);
}

BuildOrchestrator::BuildOrchestrator(std::shared_ptr<CommandRunner> runner, BuildSettings build, SimulatorSettings simulator)
    : runner_(std::move(runner)), build_(std::move(build)), simulator_(std::move(simulator)) {
  if (!runner_) {
    throw std::invalid_argument("BuildOrchestrator requires a command runner");
  }
}

void BuildOrchestrator::Require(const std::string& value, const std::string& field) const {
  if (value.empty()) {
    throw util::InvalidConfig(field + " is not configured");
  }
}

CommandResult BuildOrchestrator::RunChecked(const std::vector<std::string>& argv, const std::string& step) {
  auto result = runner_->Run(argv);
  if (result.exit_code != 0) {
    auto tail = OutputTail(result.output);
    PBXPATCH_LOG_ERROR("Tool failed", {observability::StringField("step", step), observability::IntField("exit_code", result.exit_code)});
    if (!tail.empty()) PBXPATCH_LOG_ERROR(tail);
    throw util::ToolFailure(step + " failed with exit code " + std::to_string(result.exit_code), result.exit_code, std::move(tail));
  }
  return result;
}

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

void BuildOrchestrator::Build() {
  Require(build_.project_path, "build.project_path");
  Require(build_.scheme, "build.scheme");
  Require(build_.derived_data_path, "build.derived_data_path");
  Require(simulator_.device_id, "simulator.device_id");

  PBXPATCH_LOG_INFO("Building", {observability::StringField("project", build_.project_path), observability::StringField("scheme", build_.scheme),
                                 observability::StringField("configuration", build_.configuration)});

  RunChecked({"xcodebuild", "-project", build_.project_path, "-scheme", build_.scheme, "-configuration", build_.configuration, "-destination",
              "platform=iOS Simulator,id=" + simulator_.device_id, "-derivedDataPath", build_.derived_data_path, "build"},
             "xcodebuild");

  PBXPATCH_LOG_INFO("Build succeeded");
}

std::filesystem::path BuildOrchestrator::AppBundlePath() const {
  return std::filesystem::path(build_.derived_data_path) / "Build" / "Products" / (build_.configuration + "-iphonesimulator") / (simulator_.app_name + ".app");
}

// ------------------------------------------------------------
// Simulator
// ------------------------------------------------------------

void BuildOrchestrator::BootSimulator() {
  Require(simulator_.device_id, "simulator.device_id");

  auto result = runner_->Run({"xcrun", "simctl", "boot", simulator_.device_id});
  if (result.exit_code != 0 && !AlreadyBooted(result)) {
    throw util::ToolFailure("simctl boot failed with exit code " + std::to_string(result.exit_code), result.exit_code, OutputTail(result.output));
  }
  PBXPATCH_LOG_INFO("Simulator ready", {observability::StringField("device", simulator_.device_id)});
}

void BuildOrchestrator::Install() {
  Require(simulator_.device_id, "simulator.device_id");
  Require(simulator_.app_name, "simulator.app_name");
  Require(build_.derived_data_path, "build.derived_data_path");

  const auto app = AppBundlePath();
  RunChecked({"xcrun", "simctl", "install", simulator_.device_id, app.string()}, "simctl install");
  PBXPATCH_LOG_INFO("Installed app", {observability::StringField("app", app.string())});
}

void BuildOrchestrator::Launch() {
  Require(simulator_.device_id, "simulator.device_id");
  Require(simulator_.bundle_id, "simulator.bundle_id");

  auto result = RunChecked({"xcrun", "simctl", "launch", simulator_.device_id, simulator_.bundle_id}, "simctl launch");
  PBXPATCH_LOG_INFO("Launched app", {observability::StringField("bundle_id", simulator_.bundle_id)});
  if (!result.output.empty()) PBXPATCH_LOG_INFO(OutputTail(result.output, 1));
}

std::filesystem::path BuildOrchestrator::Screenshot(std::optional<std::filesystem::path> output) {
  Require(simulator_.device_id, "simulator.device_id");

  std::filesystem::path target;
  if (output) {
    target = *output;
  } else {
    Require(simulator_.screenshot_directory, "simulator.screenshot_directory");
    target = std::filesystem::path(simulator_.screenshot_directory) / ("screenshot_" + util::CompactTimestamp(util::Now()) + ".png");
  }
  if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path());

  RunChecked({"xcrun", "simctl", "io", simulator_.device_id, "screenshot", target.string()}, "simctl screenshot");
  PBXPATCH_LOG_INFO("Saved screenshot", {observability::StringField("file", target.string())});
  return target;
}

std::filesystem::path BuildOrchestrator::CaptureLogs() {
  Require(simulator_.device_id, "simulator.device_id");
  Require(simulator_.app_name, "simulator.app_name");
  Require(simulator_.log_directory, "simulator.log_directory");

  auto result = RunChecked({"xcrun", "simctl", "spawn", simulator_.device_id, "log", "show", "--style", "compact", "--last", "5m", "--predicate",
                            "process == \"" + simulator_.app_name + "\""},
                           "simctl log show");

  std::filesystem::create_directories(simulator_.log_directory);
  const auto target = std::filesystem::path(simulator_.log_directory) / ("simulator_" + util::CompactTimestamp(util::Now()) + ".log");

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open " + target.string() + " for writing");
  }
  out << result.output;
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write " + target.string());
  }

  PBXPATCH_LOG_INFO("Captured simulator logs", {observability::StringField("file", target.string()),
                                                observability::IntField("bytes", static_cast<std::int64_t>(result.output.size()))});
  return target;
}

} // namespace pbxpatch::toolchain
