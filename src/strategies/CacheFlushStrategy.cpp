#include "strategies/CacheFlushStrategy.hpp"

#include "common/Logger.hpp"
#include "common/Subprocess.hpp"
#include "runtime/IContainerRuntime.hpp"

namespace rwd::strategies {

CacheFlushStrategy::CacheFlushStrategy(StrategyContext ctx) : GenericStrategy(std::move(ctx)) {}

common::ServiceKind CacheFlushStrategy::kind() const {
  return common::ServiceKind::StatefulCache;
}

common::StepResult CacheFlushStrategy::preRollback() {
  auto spLog = common::Logger::get();
  const auto& vCommand = _ctx.spProfile.vCommand;
  if (vCommand.empty()) {
    return common::StepResult::skipped("no flush command configured");
  }

  try {
    if (!_ctx.runtime.isRunning(_ctx.sService)) {
      return common::StepResult::skipped("not running, nothing to flush");
    }

    spLog->info("[{}] flushing before stop: {}", _ctx.sService,
                common::Subprocess::describe(vCommand));
    const auto cr = _ctx.runtime.exec(_ctx.sService, vCommand, _ctx.tmTimings.durExecTimeout);
    if (cr.ok()) {
      return common::StepResult::succeeded("flushed");
    }
    const std::string sReason =
        cr.bTimedOut ? std::string("flush timed out") : "flush exited " + std::to_string(cr.iExitCode);
    spLog->warn("[{}] {}; continuing without flush", _ctx.sService, sReason);
    return common::StepResult::failed(sReason);
  } catch (const std::exception& ex) {
    spLog->warn("[{}] flush raised: {}; continuing without flush", _ctx.sService, ex.what());
    return common::StepResult::failed(std::string("flush raised: ") + ex.what());
  }
}

}  // namespace rwd::strategies
