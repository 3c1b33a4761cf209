#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "strategies/IServiceStrategy.hpp"

namespace rwd::strategies {

/// Default behaviour: no-op hooks, stop / restore image / start through the
/// runtime, health = container reported running within the health timeout.
/// Class abbreviation: gs
class GenericStrategy : public IServiceStrategy {
 public:
  explicit GenericStrategy(StrategyContext ctx);
  ~GenericStrategy() override;

  common::ServiceKind kind() const override;
  const std::string& service() const override;

  common::StepResult preRollback() override;
  common::StepResult stop() override;
  common::StepResult restoreImage() override;
  common::StepResult start() override;
  common::StepResult postRollback() override;
  bool verifyHealth() override;

 protected:
  /// Run a runtime call, turning false or an exception into a Failed step.
  common::StepResult attempt(const char* pOperation, const std::function<bool()>& fnCall);

  /// Poll fnCheck with exponential backoff (capped at 8x the base interval)
  /// until it returns true or durTimeout elapses.
  bool pollUntil(std::chrono::milliseconds durTimeout, const std::function<bool()>& fnCheck);

  /// Poll the runtime's reported container state for "running".
  bool waitForRunning(std::chrono::milliseconds durTimeout);

  StrategyContext _ctx;
};

}  // namespace rwd::strategies
