#include "strategies/CacheFlushStrategy.hpp"
#include "strategies/ConfigReloadStrategy.hpp"
#include "strategies/GenericStrategy.hpp"
#include "strategies/HttpHealthStrategy.hpp"
#include "strategies/StrategyFactory.hpp"

#include <gtest/gtest.h>

#include "unit/FakeRuntime.hpp"

using namespace rwd::strategies;
using rwd::common::CommandResult;
using rwd::common::ServiceKind;
using rwd::common::ServiceProfile;
using rwd::common::StepOutcome;
using rwd::test::FakeRuntime;
using namespace std::chrono_literals;

namespace {

StrategyTimings fastTimings() {
  StrategyTimings tm;
  tm.durHealthTimeout = 100ms;
  tm.durHttpHealthTimeout = 150ms;
  tm.durPollInterval = 5ms;
  tm.durExecTimeout = 50ms;
  return tm;
}

StrategyContext contextFor(FakeRuntime& rt, const std::string& sService,
                           const std::string& sImage, ServiceProfile spProfile = {}) {
  return StrategyContext{rt, sService, sImage, std::move(spProfile), fastTimings()};
}

CommandResult exitWith(int iCode) {
  CommandResult cr;
  cr.iExitCode = iCode;
  return cr;
}

}  // namespace

// ── Generic ────────────────────────────────────────────────────────────────

TEST(GenericStrategyTest, HooksAreNoops) {
  FakeRuntime rt;
  rt.addService("worker", "worker:1");
  GenericStrategy gs(contextFor(rt, "worker", "worker:1"));

  EXPECT_EQ(gs.preRollback().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(gs.postRollback().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(rt.calls("exec"), 0);
}

TEST(GenericStrategyTest, StopRestoreStartDriveTheRuntime) {
  FakeRuntime rt;
  rt.addService("worker", "worker:2");
  GenericStrategy gs(contextFor(rt, "worker", "worker:1"));

  EXPECT_EQ(gs.stop().eOutcome, StepOutcome::Succeeded);
  EXPECT_FALSE(rt.isRunning("worker"));
  auto stImage = gs.restoreImage();
  EXPECT_EQ(stImage.eOutcome, StepOutcome::Succeeded);
  EXPECT_EQ(stImage.sDetail, "worker:1");
  EXPECT_EQ(gs.start().eOutcome, StepOutcome::Succeeded);
  EXPECT_EQ(*rt.getImage("worker"), "worker:1");
  EXPECT_TRUE(gs.verifyHealth());
}

TEST(GenericStrategyTest, RestoreImageSkippedWithoutTarget) {
  FakeRuntime rt;
  rt.addService("worker", "worker:2");
  GenericStrategy gs(contextFor(rt, "worker", ""));
  EXPECT_EQ(gs.restoreImage().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(rt.calls("restore_image"), 0);
}

TEST(GenericStrategyTest, RuntimeFailureBecomesFailedStep) {
  FakeRuntime rt;
  rt.addService("worker", "worker:1");
  rt.failOn("start", "worker");
  GenericStrategy gs(contextFor(rt, "worker", "worker:1"));
  gs.stop();

  auto st = gs.start();
  EXPECT_EQ(st.eOutcome, StepOutcome::Failed);
  EXPECT_FALSE(st.sDetail.empty());
}

TEST(GenericStrategyTest, VerifyHealthTimesOutWithoutThrowing) {
  FakeRuntime rt;
  rt.addService("worker", "worker:1", false);
  GenericStrategy gs(contextFor(rt, "worker", "worker:1"));

  const auto tpStart = std::chrono::steady_clock::now();
  EXPECT_FALSE(gs.verifyHealth());
  EXPECT_GE(std::chrono::steady_clock::now() - tpStart, 100ms);
  EXPECT_GE(rt.calls("is_running", "worker"), 2);
}

// ── Stateful cache ─────────────────────────────────────────────────────────

TEST(CacheFlushStrategyTest, FlushesBeforeStop) {
  FakeRuntime rt;
  rt.addService("redis", "redis:7");
  ServiceProfile sp{ServiceKind::StatefulCache, "", {"redis-cli", "SAVE"}};
  CacheFlushStrategy cfs(contextFor(rt, "redis", "redis:7", sp));

  EXPECT_EQ(cfs.preRollback().eOutcome, StepOutcome::Succeeded);
  auto vLog = rt.execLog("redis");
  ASSERT_EQ(vLog.size(), 1u);
  EXPECT_EQ(vLog[0], (std::vector<std::string>{"redis-cli", "SAVE"}));
}

TEST(CacheFlushStrategyTest, FlushFailureIsReportedNotThrown) {
  FakeRuntime rt;
  rt.addService("redis", "redis:7");
  rt.setExecResult("redis", exitWith(1));
  ServiceProfile sp{ServiceKind::StatefulCache, "", {"redis-cli", "SAVE"}};
  CacheFlushStrategy cfs(contextFor(rt, "redis", "redis:7", sp));

  EXPECT_EQ(cfs.preRollback().eOutcome, StepOutcome::Failed);
  EXPECT_EQ(cfs.stop().eOutcome, StepOutcome::Succeeded);
}

TEST(CacheFlushStrategyTest, StoppedCacheIsNotFlushed) {
  FakeRuntime rt;
  rt.addService("redis", "redis:7", false);
  ServiceProfile sp{ServiceKind::StatefulCache, "", {"redis-cli", "SAVE"}};
  CacheFlushStrategy cfs(contextFor(rt, "redis", "redis:7", sp));

  EXPECT_EQ(cfs.preRollback().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(rt.calls("exec"), 0);
}

// ── HTTP-backed ────────────────────────────────────────────────────────────

TEST(HttpHealthStrategyTest, ProbeCommandsPerTool) {
  EXPECT_EQ(HttpHealthStrategy::probeCommand("curl", "http://localhost:8000/health"),
            (std::vector<std::string>{"curl", "-fsS", "-o", "/dev/null",
                                      "http://localhost:8000/health"}));
  EXPECT_EQ(HttpHealthStrategy::probeCommand("wget", "http://x/"),
            (std::vector<std::string>{"wget", "-q", "-O", "/dev/null", "http://x/"}));
}

TEST(HttpHealthStrategyTest, PostRollbackWaitsForEndpoint) {
  FakeRuntime rt;
  rt.addService("api", "api:2");
  ServiceProfile sp{ServiceKind::HttpBacked, "http://localhost:8000/health", {}};
  HttpHealthStrategy hhs(contextFor(rt, "api", "api:2", sp));

  EXPECT_EQ(hhs.postRollback().eOutcome, StepOutcome::Succeeded);
  EXPECT_TRUE(hhs.verifyHealth());
  EXPECT_EQ(rt.execLog("api").front().front(), "curl");
}

TEST(HttpHealthStrategyTest, UnreadyEndpointFailsAfterTimeout) {
  FakeRuntime rt;
  rt.addService("api", "api:2");
  rt.setExecResult("api", exitWith(22));
  ServiceProfile sp{ServiceKind::HttpBacked, "http://localhost:8000/health", {}};
  HttpHealthStrategy hhs(contextFor(rt, "api", "api:2", sp));

  EXPECT_EQ(hhs.postRollback().eOutcome, StepOutcome::Failed);
  EXPECT_FALSE(hhs.verifyHealth());
  EXPECT_GE(rt.calls("exec", "api"), 2);
}

TEST(HttpHealthStrategyTest, FallsBackToWgetWhenCurlIsMissing) {
  FakeRuntime rt;
  rt.addService("api", "api:2");
  rt.setExecResult("api", exitWith(127));
  ServiceProfile sp{ServiceKind::HttpBacked, "http://localhost:8000/health", {}};
  HttpHealthStrategy hhs(contextFor(rt, "api", "api:2", sp));

  hhs.verifyHealth();
  const auto vLog = rt.execLog("api");
  ASSERT_GE(vLog.size(), 2u);
  EXPECT_EQ(vLog[0].front(), "curl");
  EXPECT_EQ(vLog[1].front(), "wget");
  // curl is not retried once known to be missing
  EXPECT_EQ(vLog.back().front(), "wget");
}

TEST(HttpHealthStrategyTest, WithoutUrlFallsBackToContainerState) {
  FakeRuntime rt;
  rt.addService("api", "api:2");
  HttpHealthStrategy hhs(contextFor(rt, "api", "api:2", {ServiceKind::HttpBacked, "", {}}));
  EXPECT_EQ(hhs.postRollback().eOutcome, StepOutcome::Skipped);
  EXPECT_TRUE(hhs.verifyHealth());
  EXPECT_EQ(rt.calls("exec"), 0);
}

// ── Config reload ──────────────────────────────────────────────────────────

TEST(ConfigReloadStrategyTest, ReloadsInPlaceWhenImageUnchanged) {
  FakeRuntime rt;
  rt.addService("prometheus", "prom/prometheus:v2.45.0");
  ServiceProfile sp{ServiceKind::ConfigReload, "", {"kill", "-HUP", "1"}};
  ConfigReloadStrategy crs(contextFor(rt, "prometheus", "prom/prometheus:v2.45.0", sp));

  EXPECT_EQ(crs.stop().eOutcome, StepOutcome::Skipped);
  EXPECT_TRUE(crs.reloadPlanned());
  EXPECT_EQ(crs.restoreImage().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(crs.start().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(crs.postRollback().eOutcome, StepOutcome::Succeeded);

  EXPECT_EQ(rt.calls("stop"), 0);
  EXPECT_EQ(rt.calls("start"), 0);
  EXPECT_EQ(rt.execLog("prometheus").front(), (std::vector<std::string>{"kill", "-HUP", "1"}));
}

TEST(ConfigReloadStrategyTest, RestartsWhenImageDiffers) {
  FakeRuntime rt;
  rt.addService("prometheus", "prom/prometheus:v2.50.0");
  ServiceProfile sp{ServiceKind::ConfigReload, "", {"kill", "-HUP", "1"}};
  ConfigReloadStrategy crs(contextFor(rt, "prometheus", "prom/prometheus:v2.45.0", sp));

  EXPECT_EQ(crs.stop().eOutcome, StepOutcome::Succeeded);
  EXPECT_FALSE(crs.reloadPlanned());
  EXPECT_EQ(crs.restoreImage().eOutcome, StepOutcome::Succeeded);
  EXPECT_EQ(crs.start().eOutcome, StepOutcome::Succeeded);
  EXPECT_EQ(crs.postRollback().eOutcome, StepOutcome::Skipped);
  EXPECT_EQ(*rt.getImage("prometheus"), "prom/prometheus:v2.45.0");
}

TEST(ConfigReloadStrategyTest, FailedReloadFallsBackToRestart) {
  FakeRuntime rt;
  rt.addService("prometheus", "prom/prometheus:v2.45.0");
  rt.setExecResult("prometheus", exitWith(1));
  ServiceProfile sp{ServiceKind::ConfigReload, "", {"kill", "-HUP", "1"}};
  ConfigReloadStrategy crs(contextFor(rt, "prometheus", "prom/prometheus:v2.45.0", sp));

  crs.stop();
  auto st = crs.postRollback();
  EXPECT_EQ(st.eOutcome, StepOutcome::Succeeded);
  EXPECT_EQ(rt.calls("stop", "prometheus"), 1);
  EXPECT_EQ(rt.calls("start", "prometheus"), 1);
}

// ── Factory ────────────────────────────────────────────────────────────────

TEST(StrategyFactoryTest, DispatchesOnServiceKind) {
  FakeRuntime rt;
  rt.addService("svc", "svc:1");

  EXPECT_EQ(StrategyFactory::create(contextFor(rt, "svc", "svc:1"))->kind(), ServiceKind::Generic);
  EXPECT_EQ(StrategyFactory::create(
                contextFor(rt, "svc", "svc:1", {ServiceKind::StatefulCache, "", {"SAVE"}}))
                ->kind(),
            ServiceKind::StatefulCache);
  EXPECT_EQ(StrategyFactory::create(
                contextFor(rt, "svc", "svc:1", {ServiceKind::HttpBacked, "http://x/", {}}))
                ->kind(),
            ServiceKind::HttpBacked);
  auto upReload =
      StrategyFactory::create(contextFor(rt, "svc", "svc:1", {ServiceKind::ConfigReload, "", {}}));
  EXPECT_EQ(upReload->kind(), ServiceKind::ConfigReload);
  EXPECT_EQ(upReload->service(), "svc");
}
