#include "strategies/GenericStrategy.hpp"

#include "common/Logger.hpp"
#include "runtime/IContainerRuntime.hpp"

#include <algorithm>
#include <thread>

namespace rwd::strategies {

namespace {
constexpr int kMaxBackoffFactor = 8;
}  // namespace

GenericStrategy::GenericStrategy(StrategyContext ctx) : _ctx(std::move(ctx)) {}
GenericStrategy::~GenericStrategy() = default;

common::ServiceKind GenericStrategy::kind() const { return common::ServiceKind::Generic; }

const std::string& GenericStrategy::service() const { return _ctx.sService; }

common::StepResult GenericStrategy::attempt(const char* pOperation,
                                            const std::function<bool()>& fnCall) {
  try {
    if (fnCall()) {
      return common::StepResult::succeeded();
    }
    return common::StepResult::failed(std::string(pOperation) + " reported failure");
  } catch (const std::exception& ex) {
    common::Logger::get()->error("[{}] {} raised: {}", _ctx.sService, pOperation, ex.what());
    return common::StepResult::failed(std::string(pOperation) + " raised: " + ex.what());
  }
}

bool GenericStrategy::pollUntil(std::chrono::milliseconds durTimeout,
                                const std::function<bool()>& fnCheck) {
  const auto tpDeadline = std::chrono::steady_clock::now() + durTimeout;
  const auto durBase = std::max(_ctx.tmTimings.durPollInterval, std::chrono::milliseconds(1));
  auto durInterval = durBase;

  while (true) {
    try {
      if (fnCheck()) {
        return true;
      }
    } catch (const std::exception& ex) {
      common::Logger::get()->debug("[{}] health probe raised: {}", _ctx.sService, ex.what());
    }

    const auto tpNow = std::chrono::steady_clock::now();
    if (tpNow >= tpDeadline) {
      return false;
    }
    const auto durLeft =
        std::chrono::duration_cast<std::chrono::milliseconds>(tpDeadline - tpNow);
    std::this_thread::sleep_for(std::min(durInterval, durLeft));
    durInterval = std::min(durInterval * 2, durBase * kMaxBackoffFactor);
  }
}

bool GenericStrategy::waitForRunning(std::chrono::milliseconds durTimeout) {
  return pollUntil(durTimeout, [this]() { return _ctx.runtime.isRunning(_ctx.sService); });
}

// ── Hooks ──────────────────────────────────────────────────────────────────

common::StepResult GenericStrategy::preRollback() {
  return common::StepResult::skipped();
}

common::StepResult GenericStrategy::stop() {
  return attempt("stop", [this]() { return _ctx.runtime.stop(_ctx.sService); });
}

common::StepResult GenericStrategy::restoreImage() {
  if (_ctx.sTargetImage.empty()) {
    return common::StepResult::skipped("no image captured");
  }
  auto stResult = attempt("restore_image", [this]() {
    return _ctx.runtime.restoreImage(_ctx.sService, _ctx.sTargetImage);
  });
  if (stResult.eOutcome == common::StepOutcome::Succeeded) {
    stResult.sDetail = _ctx.sTargetImage;
  }
  return stResult;
}

common::StepResult GenericStrategy::start() {
  return attempt("start", [this]() { return _ctx.runtime.start(_ctx.sService); });
}

common::StepResult GenericStrategy::postRollback() {
  return common::StepResult::skipped();
}

bool GenericStrategy::verifyHealth() {
  const bool bHealthy = waitForRunning(_ctx.tmTimings.durHealthTimeout);
  if (!bHealthy) {
    common::Logger::get()->warn("[{}] not running after {}ms", _ctx.sService,
                                _ctx.tmTimings.durHealthTimeout.count());
  }
  return bHealthy;
}

}  // namespace rwd::strategies
