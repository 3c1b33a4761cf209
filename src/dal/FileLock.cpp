#include "dal/FileLock.hpp"

#include "common/Errors.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace rwd::dal {

namespace {

int openLockFile(const std::filesystem::path& pathLock) {
  std::error_code ec;
  std::filesystem::create_directories(pathLock.parent_path(), ec);
  if (ec) {
    throw common::RepositoryError("lock_dir_failed",
                                  "Cannot create directory for lock " + pathLock.string() +
                                      ": " + ec.message());
  }
  const int iFd = ::open(pathLock.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (iFd < 0) {
    throw common::RepositoryError("lock_open_failed",
                                  "Cannot open lock file " + pathLock.string() + ": " +
                                      std::strerror(errno));
  }
  return iFd;
}

}  // namespace

FileLock::FileLock(const std::filesystem::path& pathLock, Mode eMode)
    : _iFd(openLockFile(pathLock)) {
  const int iOp = eMode == Mode::Shared ? LOCK_SH : LOCK_EX;
  while (::flock(_iFd, iOp) != 0) {
    if (errno == EINTR) continue;
    const std::string sErr = std::strerror(errno);
    ::close(_iFd);
    _iFd = -1;
    throw common::RepositoryError("lock_failed",
                                  "flock failed on " + pathLock.string() + ": " + sErr);
  }
}

FileLock FileLock::tryExclusive(const std::filesystem::path& pathLock) {
  FileLock fl;
  fl._iFd = openLockFile(pathLock);
  if (::flock(fl._iFd, LOCK_EX | LOCK_NB) != 0) {
    if (errno == EWOULDBLOCK) {
      throw common::OperationInProgressError(
          "operation_in_progress",
          "Another rollback operation is running against this backup root (" +
              pathLock.parent_path().string() + ")");
    }
    throw common::RepositoryError("lock_failed",
                                  "flock failed on " + pathLock.string() + ": " +
                                      std::strerror(errno));
  }
  return fl;
}

FileLock::~FileLock() {
  release();
}

FileLock::FileLock(FileLock&& other) noexcept : _iFd(other._iFd) {
  other._iFd = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    release();
    _iFd = other._iFd;
    other._iFd = -1;
  }
  return *this;
}

void FileLock::release() noexcept {
  if (_iFd >= 0) {
    ::flock(_iFd, LOCK_UN);
    ::close(_iFd);
    _iFd = -1;
  }
}

}  // namespace rwd::dal
