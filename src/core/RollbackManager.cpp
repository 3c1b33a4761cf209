#include "core/RollbackManager.hpp"

#include "common/Digest.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Subprocess.hpp"
#include "core/ConfigSnapshotStore.hpp"
#include "core/ThreadPool.hpp"
#include "core/VolumeArchiver.hpp"
#include "dal/FileLock.hpp"
#include "dal/RollbackPointRepository.hpp"
#include "runtime/IContainerRuntime.hpp"
#include "strategies/StrategyFactory.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <future>
#include <set>

namespace rwd::core {

namespace fs = std::filesystem;
using common::ServiceRollbackState;
using common::StepOutcome;
using common::StepResult;
using strategies::IServiceStrategy;

namespace {

constexpr const char* kDefaultDescription = "Manual rollback point";
constexpr const char* kIdPrefix = "rb-";
constexpr int kIdRandomBytes = 6;
constexpr int kMaxIdAttempts = 8;
constexpr const char* kOperationLockFile = ".operation.lock";
constexpr auto kGitTimeout = std::chrono::seconds(5);

using StepFn = std::function<StepResult(IServiceStrategy&)>;

/// Invoke one strategy hook, turning an escaped exception into a Failed step.
StepResult invokeStep(IServiceStrategy& strategy, const char* pOperation, const StepFn& fnStep) {
  StepResult st;
  try {
    st = fnStep(strategy);
  } catch (const std::exception& ex) {
    st = StepResult::failed(std::string(pOperation) + " raised: " + ex.what());
  }
  if (st.eOutcome == StepOutcome::Failed) {
    common::Logger::get()->warn("[{}] {} failed: {}", strategy.service(), pOperation, st.sDetail);
  }
  return st;
}

/// Fan fnStep out over the pool for every active strategy and wait for all.
/// Inactive entries come back Skipped.
std::vector<StepResult> runPhase(ThreadPool& tp,
                                 std::vector<std::unique_ptr<IServiceStrategy>>& vStrategies,
                                 const std::vector<bool>& vActive, const char* pOperation,
                                 const StepFn& fnStep) {
  std::vector<StepResult> vOutcomes(vStrategies.size(), StepResult::skipped());
  std::vector<std::future<void>> vFutures;
  vFutures.reserve(vStrategies.size());

  for (size_t i = 0; i < vStrategies.size(); ++i) {
    if (!vActive[i]) {
      continue;
    }
    vFutures.push_back(tp.submit([&vStrategies, &vOutcomes, &fnStep, pOperation, i]() {
      vOutcomes[i] = invokeStep(*vStrategies[i], pOperation, fnStep);
    }));
  }
  for (auto& fut : vFutures) {
    fut.get();
  }
  return vOutcomes;
}

void recordStep(common::ServiceRollbackResult& srr, ServiceRollbackState eState,
                const char* pOperation, const StepResult& st) {
  srr.vSteps.push_back({eState, st.eOutcome, st.sDetail});
  srr.eFinalState = eState;
  if (st.eOutcome == StepOutcome::Failed) {
    srr.vFailures.push_back({srr.sService, pOperation, st.sDetail});
  }
}

bool stepFailed(const common::ServiceRollbackResult& srr, ServiceRollbackState eState) {
  return std::any_of(srr.vSteps.begin(), srr.vSteps.end(), [eState](const auto& sr) {
    return sr.eState == eState && sr.eOutcome == StepOutcome::Failed;
  });
}

/// Close out a service: record the health verdict and derive success.
/// Pre/post hooks are advisory; stop, image and start failures are not.
void finishService(common::ServiceRollbackResult& srr, bool bStarted, const StepResult& stHealth) {
  if (!bStarted) {
    srr.vSteps.push_back({ServiceRollbackState::Unhealthy, StepOutcome::Skipped,
                          "health check skipped, service did not start"});
    srr.bHealthVerified = false;
  } else {
    srr.bHealthVerified = stHealth.eOutcome == StepOutcome::Succeeded;
    srr.vSteps.push_back({srr.bHealthVerified ? ServiceRollbackState::Healthy
                                              : ServiceRollbackState::Unhealthy,
                          stHealth.eOutcome, stHealth.sDetail});
    if (!srr.bHealthVerified) {
      srr.vFailures.push_back({srr.sService, "verify_health", stHealth.sDetail});
    }
  }
  srr.eFinalState =
      srr.bHealthVerified ? ServiceRollbackState::Healthy : ServiceRollbackState::Unhealthy;

  srr.bSucceeded = srr.bHealthVerified && !stepFailed(srr, ServiceRollbackState::Stopped) &&
                   !stepFailed(srr, ServiceRollbackState::ImageRestored) &&
                   !stepFailed(srr, ServiceRollbackState::Started);
  if (!srr.bSucceeded && !srr.vFailures.empty()) {
    const auto& ofFirst = srr.vFailures.front();
    srr.sReason = ofFirst.sOperation + ": " + ofFirst.sReason;
  }
}

StepResult healthStep(IServiceStrategy& strategy) {
  return strategy.verifyHealth() ? StepResult::succeeded("healthy")
                                 : StepResult::failed("health check timed out");
}

}  // namespace

RollbackManager::RollbackManager(runtime::IContainerRuntime& runtime,
                                 dal::RollbackPointRepository& repo,
                                 ConfigSnapshotStore& configStore, VolumeArchiver& volumeArchiver,
                                 ManagerOptions moOptions)
    : _runtime(runtime),
      _repo(repo),
      _configStore(configStore),
      _volumeArchiver(volumeArchiver),
      _moOptions(std::move(moOptions)) {
  if (_moOptions.iMaxRollbackPoints < 1) {
    throw std::invalid_argument("max rollback points must be >= 1");
  }
  if (_moOptions.iWorkerCount < 1) {
    _moOptions.iWorkerCount = 1;
  }
  for (const auto& [sService, spProfile] : _moOptions.mServiceProfiles) {
    common::Logger::get()->debug("Service {} uses the {} strategy", sService,
                                 common::toString(spProfile.eKind));
  }
}

RollbackManager::~RollbackManager() = default;

common::ServiceKind RollbackManager::kindFor(const std::string& sService) const {
  auto it = _moOptions.mServiceProfiles.find(sService);
  return it == _moOptions.mServiceProfiles.end() ? common::ServiceKind::Generic
                                                 : it->second.eKind;
}

fs::path RollbackManager::operationLockPath() const {
  return _repo.backupRoot() / kOperationLockFile;
}

std::unique_ptr<IServiceStrategy> RollbackManager::makeStrategy(const std::string& sService,
                                                                const std::string& sImage) const {
  common::ServiceProfile spProfile;
  auto it = _moOptions.mServiceProfiles.find(sService);
  if (it != _moOptions.mServiceProfiles.end()) {
    spProfile = it->second;
  }
  return strategies::StrategyFactory::create(
      strategies::StrategyContext{_runtime, sService, sImage, spProfile, _moOptions.tmTimings});
}

// ── Creation ───────────────────────────────────────────────────────────────

std::vector<std::string> RollbackManager::resolveServices(
    const std::optional<std::vector<std::string>>& oServices) const {
  std::vector<std::string> vServices;
  std::set<std::string> setSeen;

  if (oServices && !oServices->empty()) {
    for (const auto& sService : *oServices) {
      if (setSeen.insert(sService).second) {
        vServices.push_back(sService);
      }
    }
    return vServices;
  }

  try {
    for (const auto& sService : _runtime.listServices()) {
      if (_runtime.isRunning(sService) && setSeen.insert(sService).second) {
        vServices.push_back(sService);
      }
    }
  } catch (const std::exception& ex) {
    throw common::CreationError("runtime_query_failed",
                                std::string("Cannot list running services: ") + ex.what());
  }
  if (vServices.empty()) {
    throw common::CreationError("no_running_services", "No running services to snapshot");
  }
  return vServices;
}

std::vector<std::string> RollbackManager::resolveVolumes(
    const std::vector<std::string>& vServices) const {
  std::vector<std::string> vVolumes;
  std::set<std::string> setSeen;
  for (const auto& sService : vServices) {
    try {
      for (const auto& sVolume : _runtime.listVolumes(sService)) {
        if (setSeen.insert(sVolume).second) {
          vVolumes.push_back(sVolume);
        }
      }
    } catch (const std::exception& ex) {
      throw common::CreationError("volume_query_failed",
                                  "Cannot list volumes of " + sService + ": " + ex.what());
    }
  }
  return vVolumes;
}

std::string RollbackManager::generateId() const {
  for (int i = 0; i < kMaxIdAttempts; ++i) {
    std::string sId = kIdPrefix + common::Digest::randomHex(kIdRandomBytes);
    std::error_code ec;
    if (!_repo.contains(sId) && !fs::exists(_repo.pointDirectory(sId), ec)) {
      return sId;
    }
    common::Logger::get()->debug("Rollback id {} already taken, retrying", sId);
  }
  throw common::CreationError("id_exhausted", "Could not generate a unique rollback id");
}

std::map<std::string, std::string> RollbackManager::captureMetadata(bool bIncludeVolumes) const {
  std::map<std::string, std::string> mMetadata;
  mMetadata["include_volumes"] = bIncludeVolumes ? "true" : "false";
  mMetadata["runtime"] = _runtime.name();

  char szHost[256] = {};
  if (gethostname(szHost, sizeof(szHost) - 1) == 0 && szHost[0] != '\0') {
    mMetadata["hostname"] = szHost;
  }

  const auto cr = common::Subprocess::run({"git", "rev-parse", "HEAD"}, kGitTimeout,
                                          _moOptions.pathProjectRoot.string());
  if (cr.ok()) {
    std::string sCommit = cr.sStdout;
    while (!sCommit.empty() && std::isspace(static_cast<unsigned char>(sCommit.back()))) {
      sCommit.pop_back();
    }
    if (!sCommit.empty()) {
      mMetadata["git_commit"] = sCommit;
    }
  }
  return mMetadata;
}

void RollbackManager::discardStaging(const std::string& sId) const {
  std::error_code ec;
  fs::remove_all(_repo.pointDirectory(sId), ec);
  if (ec) {
    common::Logger::get()->warn("Could not discard staging for {}: {}", sId, ec.message());
  }
}

common::RollbackPoint RollbackManager::createRollbackPoint(
    const std::string& sDescription, const std::optional<std::vector<std::string>>& oServices,
    bool bIncludeVolumes) {
  auto spLog = common::Logger::get();
  auto flOperation = dal::FileLock::tryExclusive(operationLockPath());

  common::RollbackPoint rp;
  rp.sDescription = sDescription.empty() ? kDefaultDescription : sDescription;
  rp.vServices = resolveServices(oServices);

  for (const auto& sService : rp.vServices) {
    std::optional<std::string> oImage;
    try {
      if (!_runtime.isRunning(sService)) {
        throw common::CreationError("service_not_running", "Service is not running: " + sService);
      }
      oImage = _runtime.getImage(sService);
    } catch (const common::AppError&) {
      throw;
    } catch (const std::exception& ex) {
      throw common::CreationError("runtime_query_failed",
                                  "Cannot inspect " + sService + ": " + ex.what());
    }
    if (!oImage || oImage->empty()) {
      throw common::CreationError("image_unknown", "No image reference for service " + sService);
    }
    rp.mImageReferences[sService] = *oImage;
  }

  rp.sId = generateId();
  rp.sTimestamp = common::utcTimestamp();
  const char* pUser = std::getenv("USER");
  if (pUser != nullptr && *pUser != '\0') {
    rp.sCreatedBy = pUser;
  }
  rp.mMetadata = captureMetadata(bIncludeVolumes);

  spLog->info("Creating rollback point {} for {} services", rp.sId, rp.vServices.size());
  try {
    rp.mConfigHashes = _configStore.capture(rp.sId, _moOptions.vConfigFiles);
    if (bIncludeVolumes) {
      rp.vVolumes = _volumeArchiver.backup(rp.sId, resolveVolumes(rp.vServices));
    }
    _repo.append(rp);
  } catch (...) {
    discardStaging(rp.sId);
    throw;
  }
  spLog->info("Created rollback point {} ({} configs, {} volumes)", rp.sId,
              rp.mConfigHashes.size(), rp.vVolumes.size());

  try {
    const auto ret = _repo.enforceRetention(_moOptions.iMaxRollbackPoints);
    for (const auto& sId : ret.vFailed) {
      spLog->warn("Retention could not evict {}", sId);
    }
  } catch (const common::AppError& ex) {
    spLog->warn("Retention enforcement failed: {}", ex.what());
  }

  return rp;
}

// ── Queries ────────────────────────────────────────────────────────────────

std::vector<common::RollbackPoint> RollbackManager::listRollbackPoints() const {
  return _repo.list();
}

common::RollbackPoint RollbackManager::getRollbackPoint(const std::string& sId) const {
  return _repo.get(sId);
}

common::RollbackPoint RollbackManager::latest() const {
  auto vPoints = _repo.list();
  if (vPoints.empty()) {
    throw common::NotFoundError("no_rollback_points", "No rollback points available");
  }
  return vPoints.front();
}

bool RollbackManager::deleteRollbackPoint(const std::string& sId) {
  return _repo.remove(sId);
}

common::RollbackPlan RollbackManager::planRollback(const std::string& sId) const {
  common::RollbackPlan pl;
  pl.rpPoint = _repo.get(sId);
  for (const auto& [sRel, _] : pl.rpPoint.mConfigHashes) {
    pl.vConfigFiles.push_back(sRel);
  }
  pl.vChangedConfigFiles =
      ConfigSnapshotStore::changedFiles(pl.rpPoint.mConfigHashes, _moOptions.pathProjectRoot);
  pl.vVolumes = pl.rpPoint.vVolumes;

  for (const auto& sService : pl.rpPoint.vServices) {
    common::ServicePlan svp;
    svp.sService = sService;
    auto it = pl.rpPoint.mImageReferences.find(sService);
    if (it != pl.rpPoint.mImageReferences.end()) {
      svp.sTargetImage = it->second;
    }
    svp.bConfigsChanged = !pl.vChangedConfigFiles.empty();
    svp.bVolumesIncluded = !pl.vVolumes.empty();
    pl.vServices.push_back(std::move(svp));
  }
  return pl;
}

// ── Restore ────────────────────────────────────────────────────────────────

common::RollbackReport RollbackManager::rollback(const std::string& sId, bool bDryRun,
                                                 const ConfirmFn& fnConfirm) {
  auto spLog = common::Logger::get();
  common::RollbackReport rr;
  rr.bDryRun = bDryRun;
  rr.plPlan = planRollback(sId);
  const auto& rpPoint = rr.plPlan.rpPoint;

  if (bDryRun) {
    spLog->info("Dry run for {}: {} services, {} changed configs, {} volumes", sId,
                rr.plPlan.vServices.size(), rr.plPlan.vChangedConfigFiles.size(),
                rr.plPlan.vVolumes.size());
    rr.bSuccess = true;
    return rr;
  }

  if (fnConfirm && !fnConfirm(rr.plPlan)) {
    spLog->info("Rollback to {} cancelled", sId);
    rr.bCancelled = true;
    return rr;
  }

  auto flOperation = dal::FileLock::tryExclusive(operationLockPath());
  spLog->info("Rolling back to {} ({}, {})", sId, rpPoint.sDescription, rpPoint.sTimestamp);

  const size_t nServices = rr.plPlan.vServices.size();
  std::vector<std::unique_ptr<IServiceStrategy>> vStrategies;
  vStrategies.reserve(nServices);
  rr.vResults.resize(nServices);
  for (size_t i = 0; i < nServices; ++i) {
    const auto& svp = rr.plPlan.vServices[i];
    vStrategies.push_back(makeStrategy(svp.sService, svp.sTargetImage));
    rr.vResults[i].sService = svp.sService;
  }

  const int iPoolSize =
      std::max(1, std::min(_moOptions.iWorkerCount, static_cast<int>(nServices)));
  ThreadPool tp(iPoolSize);
  const std::vector<bool> vAll(nServices, true);

  auto fnRecord = [&rr](const std::vector<StepResult>& vOutcomes, ServiceRollbackState eState,
                        const char* pOperation) {
    for (size_t i = 0; i < vOutcomes.size(); ++i) {
      recordStep(rr.vResults[i], eState, pOperation, vOutcomes[i]);
    }
  };

  spLog->info("Phase: pre-rollback hooks");
  fnRecord(runPhase(tp, vStrategies, vAll, "pre_rollback",
                    [](IServiceStrategy& s) { return s.preRollback(); }),
           ServiceRollbackState::PreHook, "pre_rollback");

  spLog->info("Phase: stopping {} services", nServices);
  fnRecord(runPhase(tp, vStrategies, vAll, "stop", [](IServiceStrategy& s) { return s.stop(); }),
           ServiceRollbackState::Stopped, "stop");

  if (!rpPoint.mConfigHashes.empty()) {
    spLog->info("Phase: restoring {} config files", rpPoint.mConfigHashes.size());
    auto crr = _configStore.restore(sId, _moOptions.pathProjectRoot, rpPoint.mConfigHashes);
    rr.vRestoredConfigs = std::move(crr.vRestored);
    rr.vFailures.insert(rr.vFailures.end(), crr.vFailures.begin(), crr.vFailures.end());
  }

  spLog->info("Phase: restoring images");
  fnRecord(runPhase(tp, vStrategies, vAll, "restore_image",
                    [](IServiceStrategy& s) { return s.restoreImage(); }),
           ServiceRollbackState::ImageRestored, "restore_image");

  if (!rpPoint.vVolumes.empty()) {
    spLog->info("Phase: restoring {} volumes", rpPoint.vVolumes.size());
    auto vrr = _volumeArchiver.restore(sId, rpPoint.vVolumes);
    rr.vRestoredVolumes = std::move(vrr.vRestored);
    rr.vFailures.insert(rr.vFailures.end(), vrr.vFailures.begin(), vrr.vFailures.end());
  }

  // Configs and volumes are shared; every service sees the same outcome
  StepResult stShared;
  if (!rr.vFailures.empty()) {
    stShared = StepResult::failed(std::to_string(rr.vFailures.size()) + " shared restores failed");
  } else if (rr.vRestoredConfigs.empty() && rr.vRestoredVolumes.empty()) {
    stShared = StepResult::skipped("nothing staged");
  } else {
    stShared = StepResult::succeeded(std::to_string(rr.vRestoredConfigs.size()) + " configs, " +
                                     std::to_string(rr.vRestoredVolumes.size()) + " volumes");
  }
  for (auto& srr : rr.vResults) {
    srr.vSteps.push_back({ServiceRollbackState::ConfigRestored, stShared.eOutcome, stShared.sDetail});
    srr.eFinalState = ServiceRollbackState::ConfigRestored;
  }

  spLog->info("Phase: starting {} services", nServices);
  fnRecord(runPhase(tp, vStrategies, vAll, "start", [](IServiceStrategy& s) { return s.start(); }),
           ServiceRollbackState::Started, "start");

  std::vector<bool> vStarted(nServices);
  for (size_t i = 0; i < nServices; ++i) {
    vStarted[i] = !stepFailed(rr.vResults[i], ServiceRollbackState::Started);
  }

  spLog->info("Phase: post-rollback hooks and health checks");
  const auto vPost = runPhase(tp, vStrategies, vStarted, "post_rollback",
                              [](IServiceStrategy& s) { return s.postRollback(); });
  for (size_t i = 0; i < nServices; ++i) {
    if (vStarted[i]) {
      recordStep(rr.vResults[i], ServiceRollbackState::HealthChecking, "post_rollback", vPost[i]);
    }
  }
  const auto vHealth = runPhase(tp, vStrategies, vStarted, "verify_health", healthStep);
  tp.shutdown();

  rr.bSuccess = rr.vFailures.empty();
  for (size_t i = 0; i < nServices; ++i) {
    finishService(rr.vResults[i], vStarted[i], vHealth[i]);
    if (rr.vResults[i].bSucceeded) {
      spLog->info("[{}] healthy", rr.vResults[i].sService);
    } else {
      spLog->error("[{}] rollback failed: {}", rr.vResults[i].sService, rr.vResults[i].sReason);
      rr.bSuccess = false;
    }
  }

  if (rr.bSuccess) {
    spLog->info("Rollback to {} completed", sId);
  } else {
    spLog->error("Rollback to {} finished with failures", sId);
  }
  return rr;
}

common::ServiceRollbackResult RollbackManager::rollbackService(
    const std::string& sService, const std::optional<std::string>& oImage) {
  auto spLog = common::Logger::get();
  auto flOperation = dal::FileLock::tryExclusive(operationLockPath());

  const auto vKnown = _runtime.listServices();
  if (std::find(vKnown.begin(), vKnown.end(), sService) == vKnown.end()) {
    throw common::NotFoundError("service_not_found", "Unknown service: " + sService);
  }

  spLog->info("Rolling back service {}{}", sService, oImage ? " to " + *oImage : std::string{});
  auto upStrategy = makeStrategy(sService, oImage.value_or(std::string{}));
  auto& strategy = *upStrategy;

  common::ServiceRollbackResult srr;
  srr.sService = sService;
  recordStep(srr, ServiceRollbackState::PreHook, "pre_rollback",
             invokeStep(strategy, "pre_rollback", [](IServiceStrategy& s) { return s.preRollback(); }));
  recordStep(srr, ServiceRollbackState::Stopped, "stop",
             invokeStep(strategy, "stop", [](IServiceStrategy& s) { return s.stop(); }));
  recordStep(srr, ServiceRollbackState::ImageRestored, "restore_image",
             invokeStep(strategy, "restore_image", [](IServiceStrategy& s) { return s.restoreImage(); }));
  recordStep(srr, ServiceRollbackState::Started, "start",
             invokeStep(strategy, "start", [](IServiceStrategy& s) { return s.start(); }));

  const bool bStarted = !stepFailed(srr, ServiceRollbackState::Started);
  StepResult stHealth = StepResult::skipped();
  if (bStarted) {
    recordStep(srr, ServiceRollbackState::HealthChecking, "post_rollback",
               invokeStep(strategy, "post_rollback", [](IServiceStrategy& s) { return s.postRollback(); }));
    stHealth = invokeStep(strategy, "verify_health", healthStep);
  }
  finishService(srr, bStarted, stHealth);

  if (srr.bSucceeded) {
    spLog->info("[{}] rolled back and healthy", sService);
  } else {
    spLog->error("[{}] service rollback failed: {}", sService, srr.sReason);
  }
  return srr;
}

}  // namespace rwd::core
