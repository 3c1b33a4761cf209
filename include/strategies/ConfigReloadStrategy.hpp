#pragma once

#include "strategies/GenericStrategy.hpp"

namespace rwd::strategies {

/// Service that can re-read its configuration in place (e.g. SIGHUP).
/// When the running image already matches the target, the container is kept
/// up through the rollback and reloaded afterwards; if the reload command
/// fails it falls back to a full stop/start. Otherwise behaves as Generic.
/// Class abbreviation: crs
class ConfigReloadStrategy : public GenericStrategy {
 public:
  explicit ConfigReloadStrategy(StrategyContext ctx);

  common::ServiceKind kind() const override;
  common::StepResult stop() override;
  common::StepResult restoreImage() override;
  common::StepResult start() override;
  common::StepResult postRollback() override;

  bool reloadPlanned() const { return _bReloadInPlace; }

 private:
  bool _bReloadInPlace = false;
};

}  // namespace rwd::strategies
