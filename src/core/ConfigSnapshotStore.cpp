#include "core/ConfigSnapshotStore.hpp"

#include "common/Digest.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace rwd::core {

namespace fs = std::filesystem;

namespace {
constexpr const char* kConfigsDir = "configs";
}  // namespace

ConfigSnapshotStore::ConfigSnapshotStore(fs::path pathBackupRoot, fs::path pathSourceRoot)
    : _pathBackupRoot(std::move(pathBackupRoot)), _pathSourceRoot(std::move(pathSourceRoot)) {}

ConfigSnapshotStore::~ConfigSnapshotStore() = default;

fs::path ConfigSnapshotStore::stagingDirectory(const std::string& sRollbackId) const {
  return _pathBackupRoot / sRollbackId / kConfigsDir;
}

bool ConfigSnapshotStore::isSafeRelative(const std::string& sPath) {
  if (sPath.empty()) {
    return false;
  }
  const fs::path path(sPath);
  if (path.is_absolute() || path.has_root_path()) {
    return false;
  }
  for (const auto& part : path) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

// ── Capture ────────────────────────────────────────────────────────────────

std::map<std::string, std::string> ConfigSnapshotStore::capture(
    const std::string& sRollbackId, const std::vector<std::string>& vRelativePaths) const {
  auto spLog = common::Logger::get();
  std::map<std::string, std::string> mHashes;
  const fs::path pathStaging = stagingDirectory(sRollbackId);

  for (const auto& sRel : vRelativePaths) {
    if (!isSafeRelative(sRel)) {
      throw common::CreationError("invalid_config_path",
                                  "Config path must be relative and inside the project: " + sRel);
    }

    const fs::path pathSrc = _pathSourceRoot / sRel;
    std::error_code ec;
    if (!fs::is_regular_file(pathSrc, ec)) {
      spLog->warn("Config file not found, skipping: {}", pathSrc.string());
      continue;
    }

    const fs::path pathDst = pathStaging / sRel;
    fs::create_directories(pathDst.parent_path(), ec);
    if (ec) {
      throw common::CreationError("config_stage_failed",
                                  "Cannot create " + pathDst.parent_path().string() + ": " +
                                      ec.message());
    }
    fs::copy_file(pathSrc, pathDst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw common::CreationError("config_stage_failed",
                                  "Cannot copy " + pathSrc.string() + ": " + ec.message());
    }

    // Hash the staged bytes so the record describes exactly what will be restored
    try {
      mHashes[fs::path(sRel).lexically_normal().generic_string()] =
          common::Digest::sha256File(pathDst);
    } catch (const std::exception& ex) {
      throw common::CreationError("config_stage_failed", ex.what());
    }
    spLog->debug("Staged config {}", sRel);
  }

  return mHashes;
}

// ── Restore ────────────────────────────────────────────────────────────────

ConfigRestoreResult ConfigSnapshotStore::restore(
    const std::string& sRollbackId, const fs::path& pathTargetRoot,
    const std::map<std::string, std::string>& mExpectedHashes) const {
  auto spLog = common::Logger::get();
  ConfigRestoreResult crr;
  const fs::path pathStaging = stagingDirectory(sRollbackId);

  std::vector<std::string> vToRestore;
  if (!mExpectedHashes.empty()) {
    for (const auto& [sRel, _] : mExpectedHashes) {
      vToRestore.push_back(sRel);
    }
  } else {
    std::error_code ec;
    if (fs::is_directory(pathStaging, ec)) {
      for (auto it = fs::recursive_directory_iterator(pathStaging, ec);
           !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file()) {
          vToRestore.push_back(fs::relative(it->path(), pathStaging).generic_string());
        }
      }
    }
    if (ec) {
      crr.vFailures.push_back({pathStaging.string(), "restore_config", ec.message()});
      return crr;
    }
  }

  for (const auto& sRel : vToRestore) {
    if (!isSafeRelative(sRel)) {
      crr.vFailures.push_back({sRel, "restore_config", "unsafe relative path"});
      continue;
    }

    const fs::path pathSrc = pathStaging / sRel;
    const fs::path pathDst = pathTargetRoot / sRel;
    std::error_code ec;

    if (!fs::is_regular_file(pathSrc, ec)) {
      crr.vFailures.push_back({sRel, "restore_config", "staged copy missing"});
      spLog->error("Staged config missing for {}", sRel);
      continue;
    }

    auto itExpected = mExpectedHashes.find(sRel);
    if (itExpected != mExpectedHashes.end()) {
      try {
        const auto sActual = common::Digest::sha256File(pathSrc);
        if (sActual != itExpected->second) {
          crr.vFailures.push_back({sRel, "restore_config", "staged copy hash mismatch"});
          spLog->error("Staged config {} does not match its recorded hash", sRel);
          continue;
        }
      } catch (const std::exception& ex) {
        crr.vFailures.push_back({sRel, "restore_config", ex.what()});
        continue;
      }
    }

    fs::create_directories(pathDst.parent_path(), ec);
    if (!ec) {
      fs::copy_file(pathSrc, pathDst, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
      crr.vFailures.push_back({sRel, "restore_config", ec.message()});
      spLog->error("Failed to restore {}: {}", sRel, ec.message());
      continue;
    }

    crr.vRestored.push_back(sRel);
    spLog->info("Restored config {}", sRel);
  }

  return crr;
}

std::vector<std::string> ConfigSnapshotStore::changedFiles(
    const std::map<std::string, std::string>& mHashes, const fs::path& pathTargetRoot) {
  std::vector<std::string> vChanged;
  for (const auto& [sRel, sHash] : mHashes) {
    const fs::path pathLocal = pathTargetRoot / sRel;
    std::error_code ec;
    if (!fs::is_regular_file(pathLocal, ec)) {
      vChanged.push_back(sRel);
      continue;
    }
    try {
      if (common::Digest::sha256File(pathLocal) != sHash) {
        vChanged.push_back(sRel);
      }
    } catch (const std::exception&) {
      vChanged.push_back(sRel);  // unreadable counts as changed
    }
  }
  return vChanged;
}

}  // namespace rwd::core
