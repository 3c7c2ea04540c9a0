#pragma once

#include <string>
#include <vector>

namespace pbxpatch::toolchain {

struct CommandResult {
  int         exit_code = 0;
  std::string output; // stdout and stderr, interleaved
};

/*
  Runs an external program to completion.

  argv[0] is looked up on PATH. A non-zero exit is reported through
  CommandResult, not thrown; failing to start the program throws.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
};

} // namespace pbxpatch::toolchain
