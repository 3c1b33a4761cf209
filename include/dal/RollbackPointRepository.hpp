#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace rwd::dal {

/// Persists the rollback index (<backup_root>/rollback_index.json) and owns the
/// per-point backing directories. All index mutations are serialized through
/// an exclusive flock on <backup_root>/.index.lock and land via temp-file +
/// rename, so a failed write leaves the previous index intact.
/// Class abbreviation: rpr
class RollbackPointRepository {
 public:
  explicit RollbackPointRepository(std::filesystem::path pathBackupRoot);
  virtual ~RollbackPointRepository();

  /// Append a fully-staged point. Throws RepositoryError on serialization or
  /// disk failure, or if the id is already present.
  void append(const common::RollbackPoint& rpPoint);

  /// All points, newest first (timestamp desc, later insertion wins ties).
  /// Throws RepositoryError on a corrupt or unreadable index.
  std::vector<common::RollbackPoint> list() const;

  /// Throws NotFoundError if the id is absent.
  common::RollbackPoint get(const std::string& sId) const;

  bool contains(const std::string& sId) const;

  /// Remove the index entry and recursively delete its backing directory.
  /// Returns false if the id did not exist.
  bool remove(const std::string& sId);

  /// Evict the oldest points beyond iMaxPoints. Each eviction is best-effort:
  /// a failure is logged and reported in vFailed but does not stop the others.
  /// A point whose directory could not be deleted is dropped from the index
  /// and still reported as failed.
  common::RetentionReport enforceRetention(int iMaxPoints);

  const std::filesystem::path& backupRoot() const { return _pathBackupRoot; }
  std::filesystem::path pointDirectory(const std::string& sId) const;
  std::filesystem::path indexPath() const;

 protected:
  /// Recursively delete a point's backing directory. Returns false (after
  /// logging) when something was left behind.
  virtual bool removeDirectory(const std::string& sId) const;

 private:
  std::filesystem::path lockPath() const;

  /// Caller must hold the index lock.
  std::vector<common::RollbackPoint> loadUnlocked() const;
  void saveUnlocked(const std::vector<common::RollbackPoint>& vPoints) const;

  static std::vector<common::RollbackPoint> newestFirst(
      std::vector<common::RollbackPoint> vInsertionOrder);

  std::filesystem::path _pathBackupRoot;
};

}  // namespace rwd::dal
