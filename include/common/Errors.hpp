#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace rwd::common {

/// Process exit codes for the command-line surface.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/// Base error for all application-level exceptions.
/// Carries the CLI exit code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2 — invalid invocation (bad arguments, bad configuration).
struct UsageError : AppError {
  explicit UsageError(std::string sCode, std::string sMsg)
      : AppError(kExitUsage, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 1 — a rollback point could not be fully and atomically captured.
/// No index entry is written when this is thrown.
struct CreationError : AppError {
  explicit CreationError(std::string sCode, std::string sMsg)
      : AppError(kExitFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 1 — requested rollback point does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(kExitFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 1 — rollback index unreadable, corrupt or unwritable.
struct RepositoryError : AppError {
  explicit RepositoryError(std::string sCode, std::string sMsg)
      : AppError(kExitFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 1 — another create/rollback holds the backup root's operation lock.
struct OperationInProgressError : AppError {
  explicit OperationInProgressError(std::string sCode, std::string sMsg)
      : AppError(kExitFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 1 — destructive rollback requested without interactive confirmation or --yes.
struct ConfirmationRequiredError : AppError {
  explicit ConfirmationRequiredError(std::string sCode, std::string sMsg)
      : AppError(kExitFailure, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace rwd::common
