#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rwd::core {
class RollbackManager;
}

namespace rwd::cli {

enum class Command { Help, Create, List, Show, Rollback, Service, Delete };

/// Parsed command line.
/// Class abbreviation: inv
struct Invocation {
  Command eCommand = Command::Help;
  std::optional<std::string> oBackupDir;
  std::optional<std::string> oProjectRoot;

  std::string sTarget;  // rollback id, "latest" or service name
  std::string sDescription;
  std::vector<std::string> vServices;
  std::optional<std::string> oImage;
  bool bIncludeVolumes = false;
  bool bDryRun = false;
  bool bAssumeYes = false;
};

/// Command-line front end: argument parsing, table/plan rendering and the
/// confirmation prompt. Human output goes to the given stream; logs stay on
/// stderr.
/// Class abbreviation: cl
class CommandLine {
 public:
  /// Throws UsageError on unknown commands, unknown options or missing values.
  static Invocation parse(const std::vector<std::string>& vArgs);
  static const char* usage();

  CommandLine(core::RollbackManager& rmManager, std::ostream& osOut, std::istream& isIn,
              bool bInteractive);
  ~CommandLine();

  /// Execute the invocation and return the process exit code. AppErrors
  /// propagate to the caller.
  int run(const Invocation& inv);

  static void printTable(std::ostream& os, const std::vector<common::RollbackPoint>& vPoints);
  static void printPoint(std::ostream& os, const common::RollbackPoint& rp);
  static void printPlan(std::ostream& os, const common::RollbackPlan& pl);
  static void printReport(std::ostream& os, const common::RollbackReport& rr);
  static void printServiceResult(std::ostream& os, const common::ServiceRollbackResult& srr);

 private:
  int runCreate(const Invocation& inv);
  int runList();
  int runShow(const Invocation& inv);
  int runRollback(const Invocation& inv);
  int runService(const Invocation& inv);
  int runDelete(const Invocation& inv);

  /// Show the warning and read yes/no. Throws ConfirmationRequiredError
  /// when there is no terminal to ask on.
  bool confirm(const common::RollbackPlan& pl, bool bAssumeYes);

  core::RollbackManager& _rmManager;
  std::ostream& _osOut;
  std::istream& _isIn;
  bool _bInteractive;
};

}  // namespace rwd::cli
