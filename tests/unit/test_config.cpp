#include "common/Config.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

using namespace rwd::common;

namespace {

void clearAllRewindEnv() {
  const char* vVars[] = {
      "REWIND_BACKUP_DIR", "REWIND_PROJECT_ROOT", "REWIND_MAX_ROLLBACK_POINTS",
      "REWIND_CONFIG_FILES", "REWIND_COMPOSE_COMMAND", "REWIND_DOCKER_COMMAND",
      "REWIND_VOLUME_HELPER_IMAGE", "REWIND_COMMAND_TIMEOUT_SECONDS",
      "REWIND_HEALTH_TIMEOUT_SECONDS", "REWIND_HTTP_HEALTH_TIMEOUT_SECONDS",
      "REWIND_HEALTH_POLL_INTERVAL_MS", "REWIND_WORKER_COUNT", "REWIND_SERVICE_PROFILES",
      "REWIND_LOG_LEVEL",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllRewindEnv(); }
  void TearDown() override { clearAllRewindEnv(); }
};

TEST_F(ConfigTest, LoadsDefaultsWithEmptyEnvironment) {
  auto cfg = Config::load();
  EXPECT_EQ(cfg.sBackupDir, "rollback/backups");
  EXPECT_EQ(cfg.sProjectRoot, ".");
  EXPECT_EQ(cfg.iMaxRollbackPoints, 10);
  ASSERT_EQ(cfg.vConfigFiles.size(), 4u);
  EXPECT_EQ(cfg.vConfigFiles[0], "docker-compose.yml");
  EXPECT_EQ(cfg.vConfigFiles[3], "deployment/prometheus.yml");
  EXPECT_EQ(cfg.vComposeCommand, (std::vector<std::string>{"docker", "compose"}));
  EXPECT_EQ(cfg.iCommandTimeoutSeconds, 120);
  EXPECT_EQ(cfg.iHealthTimeoutSeconds, 10);
  EXPECT_EQ(cfg.iHttpHealthTimeoutSeconds, 30);
  EXPECT_EQ(cfg.iWorkerCount, 4);
  EXPECT_EQ(cfg.sLogLevel, "info");
}

TEST_F(ConfigTest, DefaultProfilesCoverKnownServices) {
  auto cfg = Config::load();
  ASSERT_EQ(cfg.mServiceProfiles.count("redis"), 1u);
  EXPECT_EQ(cfg.mServiceProfiles["redis"].eKind, ServiceKind::StatefulCache);
  EXPECT_EQ(cfg.mServiceProfiles["api"].eKind, ServiceKind::HttpBacked);
  EXPECT_EQ(cfg.mServiceProfiles["api"].sHealthUrl, "http://localhost:8000/health");
  EXPECT_EQ(cfg.mServiceProfiles["prometheus"].eKind, ServiceKind::ConfigReload);
}

TEST_F(ConfigTest, OverrideDefaults) {
  setenv("REWIND_BACKUP_DIR", "/var/lib/rewind", 1);
  setenv("REWIND_MAX_ROLLBACK_POINTS", "3", 1);
  setenv("REWIND_CONFIG_FILES", "compose.yml, env/.env ,", 1);
  setenv("REWIND_COMPOSE_COMMAND", "docker-compose", 1);
  setenv("REWIND_WORKER_COUNT", "8", 1);
  setenv("REWIND_LOG_LEVEL", "debug", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sBackupDir, "/var/lib/rewind");
  EXPECT_EQ(cfg.iMaxRollbackPoints, 3);
  EXPECT_EQ(cfg.vConfigFiles, (std::vector<std::string>{"compose.yml", "env/.env"}));
  EXPECT_EQ(cfg.vComposeCommand, (std::vector<std::string>{"docker-compose"}));
  EXPECT_EQ(cfg.iWorkerCount, 8);
  EXPECT_EQ(cfg.sLogLevel, "debug");
}

TEST_F(ConfigTest, MaxRollbackPointsMustBeAtLeastOne) {
  setenv("REWIND_MAX_ROLLBACK_POINTS", "0", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, RejectsNonNumericInteger) {
  setenv("REWIND_COMMAND_TIMEOUT_SECONDS", "12s", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, HttpHealthTimeoutMustCoverGenericTimeout) {
  setenv("REWIND_HEALTH_TIMEOUT_SECONDS", "20", 1);
  setenv("REWIND_HTTP_HEALTH_TIMEOUT_SECONDS", "15", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
  setenv("REWIND_LOG_LEVEL", "verbose", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
  setenv("REWIND_LOG_LEVEL", "off", 1);
  EXPECT_EQ(Config::load().sLogLevel, "off");
}

TEST(LoggerTest, LevelNames) {
  for (const char* pLevel : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
    EXPECT_TRUE(Logger::isValidLevel(pLevel)) << pLevel;
  }
  EXPECT_FALSE(Logger::isValidLevel("verbose"));
  EXPECT_FALSE(Logger::isValidLevel(""));
  EXPECT_THROW(Logger::init("loud"), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsAbsoluteConfigPaths) {
  setenv("REWIND_CONFIG_FILES", "/etc/passwd", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ParsesCustomProfiles) {
  auto mProfiles = Config::parseServiceProfiles(
      "cache=cache:valkey-cli BGSAVE; web=http:http://localhost/ready; worker=generic; "
      "proxy=reload");
  ASSERT_EQ(mProfiles.size(), 4u);
  EXPECT_EQ(mProfiles["cache"].vCommand, (std::vector<std::string>{"valkey-cli", "BGSAVE"}));
  EXPECT_EQ(mProfiles["web"].sHealthUrl, "http://localhost/ready");
  EXPECT_EQ(mProfiles["worker"].eKind, ServiceKind::Generic);
  EXPECT_EQ(mProfiles["proxy"].vCommand, (std::vector<std::string>{"kill", "-HUP", "1"}));
}

TEST_F(ConfigTest, HttpProfileRequiresUrl) {
  EXPECT_THROW(Config::parseServiceProfiles("api=http"), std::runtime_error);
}

TEST_F(ConfigTest, UnknownProfileKindIsRejected) {
  setenv("REWIND_SERVICE_PROFILES", "db=database", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, MalformedProfileEntryIsRejected) {
  EXPECT_THROW(Config::parseServiceProfiles("=cache"), std::runtime_error);
  EXPECT_THROW(Config::parseServiceProfiles("redis"), std::runtime_error);
}
