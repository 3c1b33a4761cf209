#include "strategies/ConfigReloadStrategy.hpp"

#include "common/Logger.hpp"
#include "runtime/IContainerRuntime.hpp"

namespace rwd::strategies {

ConfigReloadStrategy::ConfigReloadStrategy(StrategyContext ctx)
    : GenericStrategy(std::move(ctx)) {}

common::ServiceKind ConfigReloadStrategy::kind() const {
  return common::ServiceKind::ConfigReload;
}

common::StepResult ConfigReloadStrategy::stop() {
  _bReloadInPlace = false;
  if (!_ctx.spProfile.vCommand.empty()) {
    try {
      if (_ctx.runtime.isRunning(_ctx.sService)) {
        const auto oCurrent = _ctx.runtime.getImage(_ctx.sService);
        _bReloadInPlace = oCurrent && (_ctx.sTargetImage.empty() || *oCurrent == _ctx.sTargetImage);
      }
    } catch (const std::exception& ex) {
      common::Logger::get()->warn("[{}] cannot inspect running image, restarting: {}",
                                  _ctx.sService, ex.what());
      _bReloadInPlace = false;
    }
  }

  if (_bReloadInPlace) {
    return common::StepResult::skipped("image unchanged, reloading in place");
  }
  return GenericStrategy::stop();
}

common::StepResult ConfigReloadStrategy::restoreImage() {
  if (_bReloadInPlace) {
    return common::StepResult::skipped("image unchanged");
  }
  return GenericStrategy::restoreImage();
}

common::StepResult ConfigReloadStrategy::start() {
  if (_bReloadInPlace) {
    return common::StepResult::skipped("kept running for reload");
  }
  return GenericStrategy::start();
}

common::StepResult ConfigReloadStrategy::postRollback() {
  if (!_bReloadInPlace) {
    return common::StepResult::skipped();
  }

  auto spLog = common::Logger::get();
  try {
    const auto cr =
        _ctx.runtime.exec(_ctx.sService, _ctx.spProfile.vCommand, _ctx.tmTimings.durExecTimeout);
    if (cr.ok()) {
      spLog->info("[{}] configuration reloaded", _ctx.sService);
      return common::StepResult::succeeded("reloaded");
    }
    spLog->warn("[{}] reload exited {}; falling back to restart", _ctx.sService, cr.iExitCode);
  } catch (const std::exception& ex) {
    spLog->warn("[{}] reload raised: {}; falling back to restart", _ctx.sService, ex.what());
  }

  const auto stStop = GenericStrategy::stop();
  const auto stStart = GenericStrategy::start();
  if (stStart.eOutcome == common::StepOutcome::Succeeded) {
    return common::StepResult::succeeded("reload unavailable, restarted");
  }
  return common::StepResult::failed("reload unavailable and restart failed: " + stStart.sDetail +
                                    (stStop.eOutcome == common::StepOutcome::Failed
                                         ? " (stop: " + stStop.sDetail + ")"
                                         : std::string{}));
}

}  // namespace rwd::strategies
