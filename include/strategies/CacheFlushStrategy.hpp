#pragma once

#include "strategies/GenericStrategy.hpp"

namespace rwd::strategies {

/// In-memory store with a durability command (e.g. redis-cli SAVE).
/// Flushes before the container is stopped; best effort, never blocks the
/// rollback. This preserves in-flight data, it does not roll data back.
/// Class abbreviation: cfs
class CacheFlushStrategy : public GenericStrategy {
 public:
  explicit CacheFlushStrategy(StrategyContext ctx);

  common::ServiceKind kind() const override;
  common::StepResult preRollback() override;
};

}  // namespace rwd::strategies
