#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rwd::core {

/// Result of restoring staged configuration files.
/// Class abbreviation: crr
struct ConfigRestoreResult {
  std::vector<std::string> vRestored;
  std::vector<common::OperationFailure> vFailures;
};

/// Copies configuration files verbatim into <backup_root>/<id>/configs/<rel>
/// and restores them additively (overwrites, never deletes extra files).
/// Keys are always relative paths so a snapshot can be restored onto a
/// different root.
/// Class abbreviation: css
class ConfigSnapshotStore {
 public:
  ConfigSnapshotStore(std::filesystem::path pathBackupRoot, std::filesystem::path pathSourceRoot);
  ~ConfigSnapshotStore();

  /// Stage each file and return relative path -> sha256 of the staged bytes.
  /// Missing files are skipped with a warning. Throws CreationError for an
  /// absolute or escaping path, or when a present file cannot be staged.
  std::map<std::string, std::string> capture(const std::string& sRollbackId,
                                             const std::vector<std::string>& vRelativePaths) const;

  /// Copy every staged file to pathTargetRoot / relative path, creating parent
  /// directories. When mExpectedHashes is non-empty, only those paths are
  /// restored and each staged file must still match its recorded hash.
  /// Per-file failures are reported, not thrown.
  ConfigRestoreResult restore(const std::string& sRollbackId,
                              const std::filesystem::path& pathTargetRoot,
                              const std::map<std::string, std::string>& mExpectedHashes = {}) const;

  /// Relative paths whose file under pathTargetRoot is missing or hashes
  /// differently from the recorded value. Reads local files only.
  static std::vector<std::string> changedFiles(const std::map<std::string, std::string>& mHashes,
                                               const std::filesystem::path& pathTargetRoot);

  /// True when sPath is relative and contains no ".." component.
  static bool isSafeRelative(const std::string& sPath);

  std::filesystem::path stagingDirectory(const std::string& sRollbackId) const;

 private:
  std::filesystem::path _pathBackupRoot;
  std::filesystem::path _pathSourceRoot;
};

}  // namespace rwd::core
