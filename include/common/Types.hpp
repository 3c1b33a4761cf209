#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rwd::common {

/// Point-in-time snapshot of a multi-service deployment.
/// Immutable once appended to the index; only full deletion is allowed.
/// Class abbreviation: rp
struct RollbackPoint {
  std::string sId;
  std::string sTimestamp;  // UTC ISO-8601, fixed width, e.g. 2026-10-19T08:15:02.123456Z
  std::string sDescription;
  std::string sCreatedBy = "system";
  std::vector<std::string> vServices;
  std::map<std::string, std::string> mImageReferences;  // service -> image ref
  std::map<std::string, std::string> mConfigHashes;     // relative path -> sha256 hex
  std::vector<std::string> vVolumes;
  std::map<std::string, std::string> mMetadata;         // informational only
};

/// Result of a spawned command or an exec inside a service container.
/// Class abbreviation: cr
struct CommandResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;
  bool bTimedOut = false;
  bool bSpawnFailed = false;

  bool ok() const { return !bTimedOut && !bSpawnFailed && iExitCode == 0; }
};

/// Strategy variant selected per service at manager construction.
enum class ServiceKind { Generic, StatefulCache, HttpBacked, ConfigReload };

/// Per-service rollback configuration.
/// Class abbreviation: sp
struct ServiceProfile {
  ServiceKind eKind = ServiceKind::Generic;
  std::string sHealthUrl;               // HttpBacked only
  std::vector<std::string> vCommand;    // StatefulCache flush / ConfigReload reload argv
};

/// Per-service restore states, in order.
/// Unhealthy is terminal for that service only.
enum class ServiceRollbackState {
  Pending,
  PreHook,
  Stopped,
  ImageRestored,
  ConfigRestored,
  Started,
  HealthChecking,
  Healthy,
  Unhealthy,
};

/// Outcome of one attempted (or deliberately skipped) step.
enum class StepOutcome { Succeeded, Failed, Skipped };

/// Outcome of a single strategy hook or runtime step.
/// Class abbreviation: st
struct StepResult {
  StepOutcome eOutcome = StepOutcome::Skipped;
  std::string sDetail;

  static StepResult succeeded(std::string sDetail = {}) {
    return {StepOutcome::Succeeded, std::move(sDetail)};
  }
  static StepResult failed(std::string sDetail) {
    return {StepOutcome::Failed, std::move(sDetail)};
  }
  static StepResult skipped(std::string sDetail = {}) {
    return {StepOutcome::Skipped, std::move(sDetail)};
  }
};

/// A captured, non-fatal failure during rollback (per service, volume or config).
/// Class abbreviation: of
struct OperationFailure {
  std::string sSubject;    // service, volume or config path
  std::string sOperation;  // "stop", "start", "restore_image", "import_volume", ...
  std::string sReason;
};

/// Step record for a service's state machine.
/// Class abbreviation: sr
struct StepRecord {
  ServiceRollbackState eState = ServiceRollbackState::Pending;
  StepOutcome eOutcome = StepOutcome::Skipped;
  std::string sDetail;
};

/// Ephemeral per-service outcome of a restore attempt.
/// Class abbreviation: srr
struct ServiceRollbackResult {
  std::string sService;
  bool bSucceeded = false;
  std::string sReason;
  bool bHealthVerified = false;
  ServiceRollbackState eFinalState = ServiceRollbackState::Pending;
  std::vector<StepRecord> vSteps;
  std::vector<OperationFailure> vFailures;
};

/// One line of a rollback execution plan.
/// Class abbreviation: svp
struct ServicePlan {
  std::string sService;
  std::string sTargetImage;  // empty when the point did not capture one
  bool bConfigsChanged = false;
  bool bVolumesIncluded = false;
};

/// Full execution plan for a rollback point. Computed without side effects.
/// Class abbreviation: pl
struct RollbackPlan {
  RollbackPoint rpPoint;
  std::vector<ServicePlan> vServices;
  std::vector<std::string> vConfigFiles;
  std::vector<std::string> vChangedConfigFiles;
  std::vector<std::string> vVolumes;
};

/// Outcome of Manager::rollback.
/// Class abbreviation: rr
struct RollbackReport {
  RollbackPlan plPlan;
  bool bDryRun = false;
  bool bCancelled = false;
  bool bSuccess = false;
  std::vector<ServiceRollbackResult> vResults;
  std::vector<std::string> vRestoredConfigs;
  std::vector<std::string> vRestoredVolumes;
  std::vector<OperationFailure> vFailures;  // shared (config/volume) failures
};

/// Outcome of retention enforcement.
/// Class abbreviation: ret
struct RetentionReport {
  std::vector<std::string> vEvicted;
  std::vector<std::string> vFailed;
};

/// Stable lowercase names for logs, JSON and tables.
const char* toString(ServiceKind eKind);
const char* toString(ServiceRollbackState eState);
const char* toString(StepOutcome eOutcome);

/// Current UTC time as fixed-width ISO-8601 with microseconds and 'Z'.
std::string utcTimestamp(std::chrono::system_clock::time_point tp =
                             std::chrono::system_clock::now());

}  // namespace rwd::common
