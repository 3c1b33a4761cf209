#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/CommandLine.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ConfigSnapshotStore.hpp"
#include "core/RollbackManager.hpp"
#include "core/VolumeArchiver.hpp"
#include "dal/RollbackPointRepository.hpp"
#include "runtime/DockerComposeRuntime.hpp"

// Startup sequence: parse arguments, load configuration, wire the runtime,
// repository, stores and manager, then dispatch the command.

int main(int argc, char** argv) {
  // ── Step 1: Parse the command line ───────────────────────────────────────
  rwd::cli::Invocation inv;
  try {
    inv = rwd::cli::CommandLine::parse(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const rwd::common::UsageError& ex) {
    std::cerr << "error: " << ex.what() << "\n\n" << rwd::cli::CommandLine::usage();
    return ex._iExitCode;
  }
  if (inv.eCommand == rwd::cli::Command::Help) {
    std::cout << rwd::cli::CommandLine::usage();
    return rwd::common::kExitSuccess;
  }

  // ── Step 2: Load and validate configuration ──────────────────────────────
  rwd::common::Config cfgApp;
  try {
    cfgApp = rwd::common::Config::load();
  } catch (const std::exception& ex) {
    std::cerr << "[config] " << ex.what() << "\n";
    return rwd::common::kExitUsage;
  }
  if (inv.oBackupDir) cfgApp.sBackupDir = *inv.oBackupDir;
  if (inv.oProjectRoot) cfgApp.sProjectRoot = *inv.oProjectRoot;

  rwd::common::Logger::init(cfgApp.sLogLevel);
  auto spLog = rwd::common::Logger::get();

  try {
    // ── Step 3: Container runtime adapter ──────────────────────────────────
    auto upRuntime = std::make_unique<rwd::runtime::DockerComposeRuntime>(
        cfgApp.sProjectRoot, cfgApp.vComposeCommand, cfgApp.vDockerCommand,
        cfgApp.sVolumeHelperImage, std::chrono::seconds(cfgApp.iCommandTimeoutSeconds));

    // ── Step 4: Repository and stores ──────────────────────────────────────
    auto upRepo = std::make_unique<rwd::dal::RollbackPointRepository>(cfgApp.sBackupDir);
    auto upConfigStore = std::make_unique<rwd::core::ConfigSnapshotStore>(
        cfgApp.sBackupDir, cfgApp.sProjectRoot);
    auto upArchiver =
        std::make_unique<rwd::core::VolumeArchiver>(*upRuntime, cfgApp.sBackupDir);

    // ── Step 5: Rollback manager ───────────────────────────────────────────
    rwd::core::ManagerOptions moOptions;
    moOptions.iMaxRollbackPoints = cfgApp.iMaxRollbackPoints;
    moOptions.vConfigFiles = cfgApp.vConfigFiles;
    moOptions.pathProjectRoot = cfgApp.sProjectRoot;
    moOptions.mServiceProfiles = cfgApp.mServiceProfiles;
    moOptions.tmTimings.durHealthTimeout = std::chrono::seconds(cfgApp.iHealthTimeoutSeconds);
    moOptions.tmTimings.durHttpHealthTimeout =
        std::chrono::seconds(cfgApp.iHttpHealthTimeoutSeconds);
    moOptions.tmTimings.durPollInterval =
        std::chrono::milliseconds(cfgApp.iHealthPollIntervalMs);
    moOptions.iWorkerCount = cfgApp.iWorkerCount;

    auto upManager = std::make_unique<rwd::core::RollbackManager>(
        *upRuntime, *upRepo, *upConfigStore, *upArchiver, std::move(moOptions));
    spLog->debug("Backup root {}, project root {}", cfgApp.sBackupDir, cfgApp.sProjectRoot);

    // ── Step 6: Dispatch ───────────────────────────────────────────────────
    rwd::cli::CommandLine clApp(*upManager, std::cout, std::cin, isatty(STDIN_FILENO) == 1);
    return clApp.run(inv);
  } catch (const rwd::common::AppError& ex) {
    spLog->error("{} ({})", ex.what(), ex._sErrorCode);
    std::cerr << "error: " << ex.what() << "\n";
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return rwd::common::kExitFailure;
  }
}
