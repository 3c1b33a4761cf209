#include "common/Config.hpp"

#include "common/Logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace rwd::common {

namespace {

std::string trim(const std::string& sValue) {
  const auto nBegin = sValue.find_first_not_of(" \t\r\n");
  if (nBegin == std::string::npos) {
    return {};
  }
  const auto nEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(nBegin, nEnd - nBegin + 1);
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::vector<std::string> Config::splitList(const std::string& sValue, char cDelim) {
  std::vector<std::string> vItems;
  size_t nStart = 0;
  while (nStart <= sValue.size()) {
    auto nEnd = sValue.find(cDelim, nStart);
    if (nEnd == std::string::npos) {
      nEnd = sValue.size();
    }
    std::string sItem = trim(sValue.substr(nStart, nEnd - nStart));
    if (!sItem.empty()) {
      vItems.push_back(std::move(sItem));
    }
    nStart = nEnd + 1;
  }
  return vItems;
}

const char* Config::defaultServiceProfiles() {
  return "redis=cache;"
         "api=http:http://localhost:8000/health;"
         "grafana=http:http://localhost:3000/api/health;"
         "prometheus=reload";
}

std::map<std::string, ServiceProfile> Config::parseServiceProfiles(const std::string& sSpec) {
  std::map<std::string, ServiceProfile> mProfiles;

  for (const auto& sEntry : splitList(sSpec, ';')) {
    const auto nEq = sEntry.find('=');
    if (nEq == std::string::npos || nEq == 0) {
      throw std::runtime_error("Malformed service profile (expected name=kind): " + sEntry);
    }
    const std::string sName = trim(sEntry.substr(0, nEq));
    std::string sKind = trim(sEntry.substr(nEq + 1));
    std::string sArgument;
    const auto nColon = sKind.find(':');
    if (nColon != std::string::npos) {
      sArgument = trim(sKind.substr(nColon + 1));
      sKind = trim(sKind.substr(0, nColon));
    }

    ServiceProfile spProfile;
    if (sKind == "generic") {
      spProfile.eKind = ServiceKind::Generic;
    } else if (sKind == "cache") {
      spProfile.eKind = ServiceKind::StatefulCache;
      spProfile.vCommand =
          sArgument.empty() ? std::vector<std::string>{"redis-cli", "SAVE"}
                            : splitList(sArgument, ' ');
    } else if (sKind == "http") {
      if (sArgument.empty()) {
        throw std::runtime_error("Service profile '" + sName +
                                 "' of kind http requires a health URL");
      }
      spProfile.eKind = ServiceKind::HttpBacked;
      spProfile.sHealthUrl = sArgument;
    } else if (sKind == "reload") {
      spProfile.eKind = ServiceKind::ConfigReload;
      spProfile.vCommand =
          sArgument.empty() ? std::vector<std::string>{"kill", "-HUP", "1"}
                            : splitList(sArgument, ' ');
    } else {
      throw std::runtime_error("Unknown service profile kind '" + sKind + "' for " + sName);
    }

    mProfiles[sName] = std::move(spProfile);
  }

  return mProfiles;
}

Config Config::load() {
  Config cfg;

  // ── Paths ──────────────────────────────────────────────────────────────
  const std::string sBackupDir = getEnv("REWIND_BACKUP_DIR");
  if (!sBackupDir.empty()) {
    cfg.sBackupDir = sBackupDir;
  }
  const std::string sProjectRoot = getEnv("REWIND_PROJECT_ROOT");
  if (!sProjectRoot.empty()) {
    cfg.sProjectRoot = sProjectRoot;
  }

  cfg.iMaxRollbackPoints = getEnvInt("REWIND_MAX_ROLLBACK_POINTS", 10);

  const std::string sConfigFiles = getEnv("REWIND_CONFIG_FILES");
  if (!sConfigFiles.empty()) {
    cfg.vConfigFiles = splitList(sConfigFiles, ',');
  }

  // ── Runtime adapter ────────────────────────────────────────────────────
  const std::string sCompose = getEnv("REWIND_COMPOSE_COMMAND");
  if (!sCompose.empty()) {
    cfg.vComposeCommand = splitList(sCompose, ' ');
  }
  const std::string sDocker = getEnv("REWIND_DOCKER_COMMAND");
  if (!sDocker.empty()) {
    cfg.vDockerCommand = splitList(sDocker, ' ');
  }
  const std::string sHelper = getEnv("REWIND_VOLUME_HELPER_IMAGE");
  if (!sHelper.empty()) {
    cfg.sVolumeHelperImage = sHelper;
  }
  cfg.iCommandTimeoutSeconds = getEnvInt("REWIND_COMMAND_TIMEOUT_SECONDS", 120);

  // ── Health ─────────────────────────────────────────────────────────────
  cfg.iHealthTimeoutSeconds = getEnvInt("REWIND_HEALTH_TIMEOUT_SECONDS", 10);
  cfg.iHttpHealthTimeoutSeconds = getEnvInt("REWIND_HTTP_HEALTH_TIMEOUT_SECONDS", 30);
  cfg.iHealthPollIntervalMs = getEnvInt("REWIND_HEALTH_POLL_INTERVAL_MS", 1000);

  cfg.iWorkerCount = getEnvInt("REWIND_WORKER_COUNT", 4);

  // ── Service strategies ─────────────────────────────────────────────────
  const std::string sProfiles = getEnv("REWIND_SERVICE_PROFILES");
  cfg.mServiceProfiles =
      parseServiceProfiles(sProfiles.empty() ? defaultServiceProfiles() : sProfiles);

  // Logging
  const std::string sLogLevel = getEnv("REWIND_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    if (!Logger::isValidLevel(sLogLevel)) {
      throw std::runtime_error("REWIND_LOG_LEVEL must be one of trace, debug, info, warn, "
                               "error, critical, off (got " + sLogLevel + ")");
    }
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iMaxRollbackPoints < 1) {
    throw std::runtime_error("REWIND_MAX_ROLLBACK_POINTS must be >= 1 (got " +
                             std::to_string(cfg.iMaxRollbackPoints) + ")");
  }
  if (cfg.iCommandTimeoutSeconds < 1) {
    throw std::runtime_error("REWIND_COMMAND_TIMEOUT_SECONDS must be >= 1 (got " +
                             std::to_string(cfg.iCommandTimeoutSeconds) + ")");
  }
  if (cfg.iWorkerCount < 1) {
    throw std::runtime_error("REWIND_WORKER_COUNT must be >= 1 (got " +
                             std::to_string(cfg.iWorkerCount) + ")");
  }
  if (cfg.iHealthPollIntervalMs < 1) {
    throw std::runtime_error("REWIND_HEALTH_POLL_INTERVAL_MS must be >= 1");
  }
  if (cfg.iHealthTimeoutSeconds < 1) {
    throw std::runtime_error("REWIND_HEALTH_TIMEOUT_SECONDS must be >= 1");
  }

  // HTTP readiness waits at least as long as the generic container poll
  if (cfg.iHttpHealthTimeoutSeconds < cfg.iHealthTimeoutSeconds) {
    throw std::runtime_error(
        "REWIND_HTTP_HEALTH_TIMEOUT_SECONDS (" + std::to_string(cfg.iHttpHealthTimeoutSeconds) +
        ") must be >= REWIND_HEALTH_TIMEOUT_SECONDS (" +
        std::to_string(cfg.iHealthTimeoutSeconds) + ")");
  }

  for (const auto& sPath : cfg.vConfigFiles) {
    if (!sPath.empty() && sPath.front() == '/') {
      throw std::runtime_error("REWIND_CONFIG_FILES entries must be relative: " + sPath);
    }
  }

  if (cfg.vComposeCommand.empty() || cfg.vDockerCommand.empty()) {
    throw std::runtime_error("REWIND_COMPOSE_COMMAND and REWIND_DOCKER_COMMAND must not be blank");
  }

  return cfg;
}

}  // namespace rwd::common
