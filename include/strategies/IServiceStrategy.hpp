#pragma once

#include <chrono>
#include <string>

#include "common/Types.hpp"

namespace rwd::runtime {
class IContainerRuntime;
}

namespace rwd::strategies {

/// Bounds for the suspension points a strategy may hit.
/// Class abbreviation: tm
struct StrategyTimings {
  std::chrono::milliseconds durHealthTimeout{std::chrono::seconds(10)};
  std::chrono::milliseconds durHttpHealthTimeout{std::chrono::seconds(30)};
  std::chrono::milliseconds durPollInterval{std::chrono::seconds(1)};
  std::chrono::milliseconds durExecTimeout{std::chrono::seconds(5)};
};

/// Everything a strategy instance needs for one service in one rollback.
/// Class abbreviation: ctx
struct StrategyContext {
  runtime::IContainerRuntime& runtime;
  std::string sService;
  std::string sTargetImage;  // empty: leave the image as configured
  common::ServiceProfile spProfile;
  StrategyTimings tmTimings;
};

/// Per-service rollback hooks. One instance per service per rollback run;
/// instances may carry state between phases.
/// The rollback capability is split into stop / restoreImage / start so the
/// manager can order phases across all services.
class IServiceStrategy {
 public:
  virtual ~IServiceStrategy() = default;

  virtual common::ServiceKind kind() const = 0;
  virtual const std::string& service() const = 0;

  virtual common::StepResult preRollback() = 0;
  virtual common::StepResult stop() = 0;
  virtual common::StepResult restoreImage() = 0;
  virtual common::StepResult start() = 0;
  virtual common::StepResult postRollback() = 0;

  /// Health check. Returns false on timeout rather than throwing.
  virtual bool verifyHealth() = 0;
};

}  // namespace rwd::strategies
