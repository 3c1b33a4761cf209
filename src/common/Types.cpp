#include "common/Types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace rwd::common {

const char* toString(ServiceKind eKind) {
  switch (eKind) {
    case ServiceKind::Generic: return "generic";
    case ServiceKind::StatefulCache: return "cache";
    case ServiceKind::HttpBacked: return "http";
    case ServiceKind::ConfigReload: return "reload";
  }
  return "generic";
}

const char* toString(ServiceRollbackState eState) {
  switch (eState) {
    case ServiceRollbackState::Pending: return "pending";
    case ServiceRollbackState::PreHook: return "pre_hook";
    case ServiceRollbackState::Stopped: return "stopped";
    case ServiceRollbackState::ImageRestored: return "image_restored";
    case ServiceRollbackState::ConfigRestored: return "config_restored";
    case ServiceRollbackState::Started: return "started";
    case ServiceRollbackState::HealthChecking: return "health_checking";
    case ServiceRollbackState::Healthy: return "healthy";
    case ServiceRollbackState::Unhealthy: return "unhealthy";
  }
  return "pending";
}

const char* toString(StepOutcome eOutcome) {
  switch (eOutcome) {
    case StepOutcome::Succeeded: return "succeeded";
    case StepOutcome::Failed: return "failed";
    case StepOutcome::Skipped: return "skipped";
  }
  return "skipped";
}

std::string utcTimestamp(std::chrono::system_clock::time_point tp) {
  const auto tpSeconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto iMicros =
      std::chrono::duration_cast<std::chrono::microseconds>(tp - tpSeconds).count();
  const std::time_t tt = std::chrono::system_clock::to_time_t(tpSeconds);

  std::tm tmUtc{};
  gmtime_r(&tt, &tmUtc);

  std::ostringstream oss;
  oss << std::put_time(&tmUtc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << iMicros << 'Z';
  return oss.str();
}

}  // namespace rwd::common
