#pragma once

#include <filesystem>

namespace rwd::dal {

/// RAII advisory lock (flock) on a lock file under the backup root.
/// Releases the lock and closes the descriptor on destruction.
/// flock locks belong to the open file description, so a process must not
/// take a second lock on the same file while holding one.
/// Class abbreviation: fl
class FileLock {
 public:
  enum class Mode { Shared, Exclusive };

  /// Blocks until the lock is granted. Throws RepositoryError on I/O failure.
  FileLock(const std::filesystem::path& pathLock, Mode eMode);
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;
  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;

  /// Non-blocking exclusive acquire. Throws OperationInProgressError when
  /// another holder exists.
  static FileLock tryExclusive(const std::filesystem::path& pathLock);

 private:
  FileLock() = default;
  void release() noexcept;

  int _iFd = -1;
};

}  // namespace rwd::dal
