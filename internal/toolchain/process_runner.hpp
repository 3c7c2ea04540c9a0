#pragma once

#include <string>
#include <vector>

#include "internal/toolchain/command_runner.hpp"

namespace pbxpatch::toolchain {

// popen-based runner. Arguments are single-quoted for /bin/sh.
class ProcessRunner final : public CommandRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv) override;

  static std::string QuoteArgument(const std::string& arg);
  static std::string CommandLine(const std::vector<std::string>& argv);
};

} // namespace pbxpatch::toolchain
