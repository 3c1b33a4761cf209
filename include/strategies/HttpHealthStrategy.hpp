#pragma once

#include <string>
#include <vector>

#include "strategies/GenericStrategy.hpp"

namespace rwd::strategies {

/// Service exposing an HTTP health endpoint. Readiness is probed from inside
/// the container (curl, falling back to wget) with backoff.
/// Class abbreviation: hhs
class HttpHealthStrategy : public GenericStrategy {
 public:
  explicit HttpHealthStrategy(StrategyContext ctx);

  common::ServiceKind kind() const override;

  /// Waits up to the HTTP health timeout for the endpoint to answer 2xx.
  common::StepResult postRollback() override;

  /// Re-checks the endpoint, bounded by the generic health timeout.
  bool verifyHealth() override;

  /// Probe argv for the given tool ("curl" or "wget").
  static std::vector<std::string> probeCommand(const std::string& sTool,
                                               const std::string& sUrl);

 private:
  bool probeOnce();

  bool _bCurlMissing = false;
};

}  // namespace rwd::strategies
