#pragma once

#include <stdexcept>
#include <string>

namespace pbxpatch::util {

/*
  Central error types.

  Every fatal condition aborts before the descriptor is written.
  The CLI translates them into exit status 2.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Required section markers are missing or a record cannot be tokenized.
class MalformedDescriptor : public std::runtime_error {
 public:
  explicit MalformedDescriptor(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An insertion point (build phase, target, group) could not be located.
class AnchorNotFound : public std::runtime_error {
 public:
  explicit AnchorNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Applying an operation would leave a dangling or duplicated reference.
class ReferentialIntegrityViolation : public std::runtime_error {
 public:
  explicit ReferentialIntegrityViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ToolFailure : public std::runtime_error {
 public:
  ToolFailure(const std::string& msg, int exit_code, std::string output)
      : std::runtime_error(msg), exit_code_(exit_code), output_(std::move(output)) {
  }

  int ExitCode() const {
    return exit_code_;
  }

  const std::string& Output() const {
    return output_;
  }

 private:
  int         exit_code_;
  std::string output_;
};

} // namespace pbxpatch::util
