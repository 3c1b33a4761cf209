#include "core/VolumeArchiver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "runtime/IContainerRuntime.hpp"

#include <algorithm>
#include <cctype>

namespace rwd::core {

namespace fs = std::filesystem;

namespace {
constexpr const char* kVolumesDir = "volumes";
constexpr const char* kArchiveSuffix = ".tar.gz";
}  // namespace

VolumeArchiver::VolumeArchiver(runtime::IContainerRuntime& runtime, fs::path pathBackupRoot)
    : _runtime(runtime), _pathBackupRoot(std::move(pathBackupRoot)) {}

VolumeArchiver::~VolumeArchiver() = default;

bool VolumeArchiver::isValidVolumeName(const std::string& sVolume) {
  if (sVolume.empty() || !std::isalnum(static_cast<unsigned char>(sVolume.front()))) {
    return false;
  }
  return std::all_of(sVolume.begin(), sVolume.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
  });
}

fs::path VolumeArchiver::archivePath(const std::string& sRollbackId,
                                     const std::string& sVolume) const {
  return _pathBackupRoot / sRollbackId / kVolumesDir / (sVolume + kArchiveSuffix);
}

std::vector<std::string> VolumeArchiver::backup(const std::string& sRollbackId,
                                                const std::vector<std::string>& vVolumes) {
  auto spLog = common::Logger::get();
  std::vector<std::string> vArchived;
  if (vVolumes.empty()) {
    return vArchived;
  }

  std::error_code ec;
  fs::create_directories(_pathBackupRoot / sRollbackId / kVolumesDir, ec);
  if (ec) {
    throw common::CreationError("volume_stage_failed",
                                "Cannot create volume staging directory: " + ec.message());
  }

  for (const auto& sVolume : vVolumes) {
    if (!isValidVolumeName(sVolume)) {
      throw common::CreationError("invalid_volume_name", "Invalid volume name: " + sVolume);
    }

    spLog->info("Archiving volume {}", sVolume);
    bool bOk = false;
    try {
      bOk = _runtime.exportVolume(sVolume, archivePath(sRollbackId, sVolume));
    } catch (const std::exception& ex) {
      throw common::CreationError("volume_export_failed",
                                  "Export of volume " + sVolume + " raised: " + ex.what());
    }
    if (!bOk) {
      throw common::CreationError("volume_export_failed",
                                  "Export of volume " + sVolume + " failed after " +
                                      std::to_string(vArchived.size()) + " of " +
                                      std::to_string(vVolumes.size()) + " volumes");
    }
    vArchived.push_back(sVolume);
  }

  return vArchived;
}

VolumeRestoreResult VolumeArchiver::restore(const std::string& sRollbackId,
                                            const std::vector<std::string>& vVolumes) {
  auto spLog = common::Logger::get();
  VolumeRestoreResult vrr;

  for (const auto& sVolume : vVolumes) {
    if (!isValidVolumeName(sVolume)) {
      vrr.vFailures.push_back({sVolume, "import_volume", "invalid volume name"});
      continue;
    }

    const auto pathArchive = archivePath(sRollbackId, sVolume);
    std::error_code ec;
    if (!fs::is_regular_file(pathArchive, ec)) {
      vrr.vFailures.push_back({sVolume, "import_volume", "archive missing"});
      spLog->error("Archive for volume {} missing: {}", sVolume, pathArchive.string());
      continue;
    }

    try {
      if (_runtime.importVolume(sVolume, pathArchive)) {
        vrr.vRestored.push_back(sVolume);
        spLog->info("Restored volume {}", sVolume);
      } else {
        vrr.vFailures.push_back({sVolume, "import_volume", "import reported failure"});
        spLog->error("Import of volume {} failed", sVolume);
      }
    } catch (const std::exception& ex) {
      vrr.vFailures.push_back({sVolume, "import_volume", ex.what()});
      spLog->error("Import of volume {} raised: {}", sVolume, ex.what());
    }
  }

  return vrr;
}

}  // namespace rwd::core
