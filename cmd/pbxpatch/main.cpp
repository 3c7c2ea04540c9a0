#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

constexpr char kDefaultConfigPath[] = "pbxpatch.yaml";

void Usage() {
  std::cout << "Usage:\n"
            << "  pbxpatch [--config FILE] [--dry-run] add-files [PATH...]\n"
            << "  pbxpatch [--config FILE] verify\n"
            << "  pbxpatch [--config FILE] build\n"
            << "  pbxpatch [--config FILE] launch\n"
            << "  pbxpatch [--config FILE] screenshot [FILE]\n"
            << "  pbxpatch [--config FILE] logs\n"
            << "  pbxpatch help\n"
            << "\n"
            << "add-files without paths scans the configured source root.\n"
            << "Default config: " << kDefaultConfigPath << "\n";
}

struct Arguments {
  std::string              config_path = kDefaultConfigPath;
  bool                     dry_run     = false;
  std::string              command;
  std::vector<std::string> operands;
};

std::optional<Arguments> ParseArguments(int argc, char** argv) {
  Arguments args;
  int       i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "--config needs a file\n";
        return std::nullopt;
      }
      args.config_path = argv[++i];
    } else if (arg == "--dry-run") {
      args.dry_run = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown option: " << arg << "\n";
      return std::nullopt;
    } else {
      break;
    }
  }

  if (i >= argc) {
    std::cerr << "missing command\n";
    return std::nullopt;
  }
  args.command = argv[i++];
  for (; i < argc; ++i) {
    args.operands.emplace_back(argv[i]);
  }
  return args;
}

int AddFiles(const pbxpatch::factory::Application& app, const Arguments& args) {
  auto candidates = args.operands.empty() ? app.scanner->Scan() : app.scanner->FromPaths(args.operands);
  PBXPATCH_LOG_INFO("Checking source files", {pbxpatch::observability::IntField("candidates", static_cast<std::int64_t>(candidates.size()))});

  auto report = app.pipeline->Register(candidates, args.dry_run);

  for (const auto& added : report.added) {
    std::cout << (args.dry_run ? "would add  " : "added      ") << added.relative_path << "\n";
  }
  for (const auto& skipped : report.skipped) {
    std::cout << "skipped    " << skipped.candidate.relative_path << " (" << pbxpatch::core::ToString(skipped.reason) << ")\n";
  }
  if (args.dry_run) {
    for (const auto& operation : report.operations) {
      std::cout << "  " << operation << "\n";
    }
  }
  if (report.added.empty()) {
    std::cout << "nothing to add\n";
  }
  return 0;
}

int Verify(const pbxpatch::factory::Application& app) {
  auto violations = app.pipeline->Verify();
  for (const auto& violation : violations) {
    std::cout << violation.ToString() << "\n";
  }
  if (!violations.empty()) {
    PBXPATCH_LOG_ERROR("Descriptor has dangling references", {pbxpatch::observability::IntField("violations", static_cast<std::int64_t>(violations.size()))});
    return 2;
  }
  std::cout << "descriptor ok\n";
  return 0;
}

int Dispatch(const pbxpatch::factory::Application& app, const Arguments& args) {
  const auto& command = args.command;

  if (command == "add-files") {
    return AddFiles(app, args);
  }
  if (command == "verify") {
    return Verify(app);
  }
  if (command == "build") {
    app.orchestrator->Build();
    return 0;
  }
  if (command == "launch") {
    app.orchestrator->BootSimulator();
    app.orchestrator->Install();
    app.orchestrator->Launch();
    return 0;
  }
  if (command == "screenshot") {
    std::optional<std::filesystem::path> output;
    if (!args.operands.empty()) output = args.operands.front();
    std::cout << app.orchestrator->Screenshot(output).string() << "\n";
    return 0;
  }
  if (command == "logs") {
    std::cout << app.orchestrator->CaptureLogs().string() << "\n";
    return 0;
  }

  std::cerr << "unknown command: " << command << "\n";
  Usage();
  return 1;
}

bool IsKnownCommand(const std::string& command) {
  for (const auto* known : {"add-files", "verify", "build", "launch", "screenshot", "logs"}) {
    if (command == known) return true;
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  auto args = ParseArguments(argc, argv);
  if (!args) {
    Usage();
    return 1;
  }
  if (args->command == "help") {
    Usage();
    return 0;
  }
  if (!IsKnownCommand(args->command)) {
    std::cerr << "unknown command: " << args->command << "\n";
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pbxpatch::config::ConfigLoader::LoadFromYaml(args->config_path);
    pbxpatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = pbxpatch::factory::Build(config);

    const int status = Dispatch(app, *args);
    pbxpatch::observability::ShutdownLogging();
    return status;
  } catch (const std::exception& e) {
    PBXPATCH_LOG_ERROR("Fatal error", {pbxpatch::observability::StringField("error", e.what())});
    pbxpatch::observability::ShutdownLogging();
    return 2;
  }
}
