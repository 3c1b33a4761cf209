#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rwd::common {

/// Environment variable loader.
/// Loads all REWIND_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Paths ─────────────────────────────────────────────────────────────
  std::string sBackupDir = "rollback/backups";
  std::string sProjectRoot = ".";

  // ── Retention ─────────────────────────────────────────────────────────
  int iMaxRollbackPoints = 10;

  // ── Capture ───────────────────────────────────────────────────────────
  std::vector<std::string> vConfigFiles = {
      "docker-compose.yml",
      "docker-compose.enterprise.yml",
      ".env",
      "deployment/prometheus.yml",
  };

  // ── Runtime adapter ───────────────────────────────────────────────────
  std::vector<std::string> vComposeCommand = {"docker", "compose"};
  std::vector<std::string> vDockerCommand = {"docker"};
  std::string sVolumeHelperImage = "alpine";
  int iCommandTimeoutSeconds = 120;

  // ── Health ────────────────────────────────────────────────────────────
  int iHealthTimeoutSeconds = 10;
  int iHttpHealthTimeoutSeconds = 30;
  int iHealthPollIntervalMs = 1000;

  // ── Worker pool ───────────────────────────────────────────────────────
  int iWorkerCount = 4;

  // ── Service strategies ────────────────────────────────────────────────
  std::map<std::string, ServiceProfile> mServiceProfiles;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Throws std::runtime_error on invalid values or constraints.
  static Config load();

  /// Parse "name=kind[:argument];..." into a profile map.
  /// Throws std::runtime_error on unknown kinds or malformed entries.
  static std::map<std::string, ServiceProfile> parseServiceProfiles(const std::string& sSpec);

  /// Built-in profile map used when REWIND_SERVICE_PROFILES is unset.
  static const char* defaultServiceProfiles();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Split on a delimiter, trimming whitespace and dropping empty items.
  static std::vector<std::string> splitList(const std::string& sValue, char cDelim);
};

}  // namespace rwd::common
