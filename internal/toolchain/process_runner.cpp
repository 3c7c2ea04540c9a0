#include "process_runner.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <stdexcept>

namespace pbxpatch::toolchain {

std::string ProcessRunner::QuoteArgument(const std::string& arg) {
  std::string quoted;
  quoted.reserve(arg.size() + 2);
  quoted.push_back('\'');

  for (const char ch : arg) {
    if (ch == '\'') {
      quoted += "'\\''";
      continue;
    }
    quoted.push_back(ch);
  }

  quoted.push_back('\'');
  return quoted;
}

std::string ProcessRunner::CommandLine(const std::vector<std::string>& argv) {
  std::string command;
  for (const auto& arg : argv) {
    if (!command.empty()) command.push_back(' ');
    command += QuoteArgument(arg);
  }
  return command;
}

CommandResult ProcessRunner::Run(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw std::invalid_argument("empty command line");
  }

  const auto command = CommandLine(argv) + " 2>&1";
  FILE*      pipe    = popen(command.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("failed to start " + argv.front());
  }

  CommandResult          result;
  std::array<char, 4096> buffer{};
  std::size_t            count = 0;
  while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.append(buffer.data(), count);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    throw std::runtime_error("failed to wait for " + argv.front());
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = status;
  }
  return result;
}

} // namespace pbxpatch::toolchain
