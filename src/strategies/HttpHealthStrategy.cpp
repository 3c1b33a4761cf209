#include "strategies/HttpHealthStrategy.hpp"

#include "common/Logger.hpp"
#include "runtime/IContainerRuntime.hpp"

namespace rwd::strategies {

namespace {
// exit codes for "command not found" / "not executable" from a container shell
constexpr int kNotFound = 127;
constexpr int kNotExecutable = 126;
}  // namespace

HttpHealthStrategy::HttpHealthStrategy(StrategyContext ctx) : GenericStrategy(std::move(ctx)) {}

common::ServiceKind HttpHealthStrategy::kind() const { return common::ServiceKind::HttpBacked; }

std::vector<std::string> HttpHealthStrategy::probeCommand(const std::string& sTool,
                                                          const std::string& sUrl) {
  if (sTool == "wget") {
    return {"wget", "-q", "-O", "/dev/null", sUrl};
  }
  return {"curl", "-fsS", "-o", "/dev/null", sUrl};
}

bool HttpHealthStrategy::probeOnce() {
  const auto& sUrl = _ctx.spProfile.sHealthUrl;
  if (!_bCurlMissing) {
    const auto cr =
        _ctx.runtime.exec(_ctx.sService, probeCommand("curl", sUrl), _ctx.tmTimings.durExecTimeout);
    if (cr.ok()) {
      return true;
    }
    if (cr.iExitCode != kNotFound && cr.iExitCode != kNotExecutable) {
      return false;
    }
    common::Logger::get()->debug("[{}] curl unavailable in container, probing with wget",
                                 _ctx.sService);
    _bCurlMissing = true;
  }
  return _ctx.runtime
      .exec(_ctx.sService, probeCommand("wget", sUrl), _ctx.tmTimings.durExecTimeout)
      .ok();
}

common::StepResult HttpHealthStrategy::postRollback() {
  if (_ctx.spProfile.sHealthUrl.empty()) {
    return common::StepResult::skipped("no health URL configured");
  }

  common::Logger::get()->info("[{}] waiting for {} (up to {}ms)", _ctx.sService,
                              _ctx.spProfile.sHealthUrl,
                              _ctx.tmTimings.durHttpHealthTimeout.count());
  if (pollUntil(_ctx.tmTimings.durHttpHealthTimeout, [this]() { return probeOnce(); })) {
    return common::StepResult::succeeded("endpoint ready");
  }
  return common::StepResult::failed("endpoint " + _ctx.spProfile.sHealthUrl +
                                    " not ready within " +
                                    std::to_string(_ctx.tmTimings.durHttpHealthTimeout.count()) +
                                    "ms");
}

bool HttpHealthStrategy::verifyHealth() {
  if (_ctx.spProfile.sHealthUrl.empty()) {
    return GenericStrategy::verifyHealth();
  }
  const bool bHealthy =
      pollUntil(_ctx.tmTimings.durHealthTimeout, [this]() { return probeOnce(); });
  if (!bHealthy) {
    common::Logger::get()->warn("[{}] health endpoint {} failing", _ctx.sService,
                                _ctx.spProfile.sHealthUrl);
  }
  return bHealthy;
}

}  // namespace rwd::strategies
