#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rwd::common {

/// Runs external commands (docker, compose, git) with captured output and a
/// hard deadline. The child is killed with SIGKILL when the deadline passes.
/// Class abbreviation: N/A (static interface)
class Subprocess {
 public:
  /// Spawn vArgv[0] (PATH lookup) with the remaining arguments.
  /// sWorkDir, when non-empty, becomes the child's working directory.
  /// Never throws for child failures: spawn errors and timeouts are
  /// reported through CommandResult flags.
  static CommandResult run(const std::vector<std::string>& vArgv,
                           std::chrono::milliseconds durTimeout,
                           const std::string& sWorkDir = {});

  /// Render argv for logs, quoting arguments containing spaces.
  static std::string describe(const std::vector<std::string>& vArgv);
};

}  // namespace rwd::common
