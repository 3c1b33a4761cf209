#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rwd::common {

/// Thin wrapper over spdlog for structured logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Logs go to stderr so tables and plans printed on stdout stay parseable.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Created rollback point {}", sId);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// Throws std::invalid_argument for anything else.
  static void init(const std::string& sLevel);

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// spdlog maps unknown names to "off"; this tells the two apart.
  static bool isValidLevel(const std::string& sLevel);

 private:
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

  static bool _bInitialized;
};

}  // namespace rwd::common
