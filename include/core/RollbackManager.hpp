#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "strategies/IServiceStrategy.hpp"

namespace rwd::runtime {
class IContainerRuntime;
}

namespace rwd::dal {
class RollbackPointRepository;
}

namespace rwd::core {

class ConfigSnapshotStore;
class VolumeArchiver;

/// Construction-time settings for the manager.
/// Class abbreviation: mo
struct ManagerOptions {
  int iMaxRollbackPoints = 10;
  std::vector<std::string> vConfigFiles;
  std::filesystem::path pathProjectRoot = ".";
  std::map<std::string, common::ServiceProfile> mServiceProfiles;
  strategies::StrategyTimings tmTimings;
  int iWorkerCount = 4;
};

/// Invoked with the plan before any destructive action. Return false to cancel.
using ConfirmFn = std::function<bool(const common::RollbackPlan&)>;

/// Orchestrates rollback point creation, listing, deletion and full-system
/// restore. Restores run in phases (stop, configs, images, volumes, start,
/// verify); per-service work inside a phase is fanned out over a bounded
/// worker pool and every phase completes for all services before the next.
/// Class abbreviation: rm
class RollbackManager {
 public:
  RollbackManager(runtime::IContainerRuntime& runtime, dal::RollbackPointRepository& repo,
                  ConfigSnapshotStore& configStore, VolumeArchiver& volumeArchiver,
                  ManagerOptions moOptions);
  ~RollbackManager();

  /// Snapshot the targeted services. Read-only with respect to running
  /// services. Throws CreationError when a service is not running, has no
  /// known image, or a requested volume cannot be archived; no index entry
  /// is written in that case.
  common::RollbackPoint createRollbackPoint(
      const std::string& sDescription,
      const std::optional<std::vector<std::string>>& oServices = std::nullopt,
      bool bIncludeVolumes = false);

  std::vector<common::RollbackPoint> listRollbackPoints() const;
  common::RollbackPoint getRollbackPoint(const std::string& sId) const;

  /// Most recent point. Throws NotFoundError when none exist.
  common::RollbackPoint latest() const;

  bool deleteRollbackPoint(const std::string& sId);

  /// Side-effect free: reads the index and hashes local config files only.
  common::RollbackPlan planRollback(const std::string& sId) const;

  /// Restore the deployment to the given point. Throws NotFoundError for an
  /// unknown id; per-service failures are reported in the result, not thrown.
  common::RollbackReport rollback(const std::string& sId, bool bDryRun = false,
                                  const ConfirmFn& fnConfirm = {});

  /// Restart a single service through its strategy, optionally pinning it
  /// to sImage first. Throws NotFoundError for an unknown service.
  common::ServiceRollbackResult rollbackService(const std::string& sService,
                                                const std::optional<std::string>& oImage);

  /// Strategy kind resolved for a service (Generic when unconfigured).
  common::ServiceKind kindFor(const std::string& sService) const;

 private:
  std::vector<std::string> resolveServices(
      const std::optional<std::vector<std::string>>& oServices) const;
  std::vector<std::string> resolveVolumes(const std::vector<std::string>& vServices) const;
  std::string generateId() const;
  std::map<std::string, std::string> captureMetadata(bool bIncludeVolumes) const;
  std::unique_ptr<strategies::IServiceStrategy> makeStrategy(const std::string& sService,
                                                             const std::string& sImage) const;
  std::filesystem::path operationLockPath() const;
  void discardStaging(const std::string& sId) const;

  runtime::IContainerRuntime& _runtime;
  dal::RollbackPointRepository& _repo;
  ConfigSnapshotStore& _configStore;
  VolumeArchiver& _volumeArchiver;
  ManagerOptions _moOptions;
};

}  // namespace rwd::core
