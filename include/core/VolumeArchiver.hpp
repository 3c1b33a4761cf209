#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rwd::runtime {
class IContainerRuntime;
}

namespace rwd::core {

/// Result of restoring archived volumes.
/// Class abbreviation: vrr
struct VolumeRestoreResult {
  std::vector<std::string> vRestored;
  std::vector<common::OperationFailure> vFailures;
};

/// Serializes named data volumes into <backup_root>/<id>/volumes/<name>.tar.gz
/// through the runtime and restores them. Performs no confirmation; callers
/// decide whether a destructive restore may run.
/// Class abbreviation: va
class VolumeArchiver {
 public:
  VolumeArchiver(runtime::IContainerRuntime& runtime, std::filesystem::path pathBackupRoot);
  ~VolumeArchiver();

  /// All-or-nothing: the first failing export throws CreationError, since a
  /// partial volume backup is worse than none.
  std::vector<std::string> backup(const std::string& sRollbackId,
                                  const std::vector<std::string>& vVolumes);

  /// Clear and re-populate each volume from its archive. Per-volume failures
  /// (missing archive, import error) are reported and do not stop the rest.
  VolumeRestoreResult restore(const std::string& sRollbackId,
                              const std::vector<std::string>& vVolumes);

  std::filesystem::path archivePath(const std::string& sRollbackId,
                                    const std::string& sVolume) const;

  /// Docker volume name charset; rejects anything that could escape the
  /// volumes directory.
  static bool isValidVolumeName(const std::string& sVolume);

 private:
  runtime::IContainerRuntime& _runtime;
  std::filesystem::path _pathBackupRoot;
};

}  // namespace rwd::core
