#include "core/VolumeArchiver.hpp"

#include <gtest/gtest.h>

#include "common/Errors.hpp"
#include "unit/FakeRuntime.hpp"

using rwd::common::CreationError;
using rwd::core::VolumeArchiver;
using rwd::test::FakeRuntime;
using rwd::test::TempDir;

class VolumeArchiverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _rt.setVolumeData("redis_data", "dump.rdb contents");
    _rt.setVolumeData("grafana_data", "grafana.db contents");
  }

  TempDir _td;
  FakeRuntime _rt;
};

TEST_F(VolumeArchiverTest, BackupArchivesEachVolume) {
  VolumeArchiver va(_rt, _td.path());
  auto vArchived = va.backup("rb-1", {"redis_data", "grafana_data"});

  EXPECT_EQ(vArchived, (std::vector<std::string>{"redis_data", "grafana_data"}));
  EXPECT_TRUE(std::filesystem::exists(va.archivePath("rb-1", "redis_data")));
  EXPECT_EQ(va.archivePath("rb-1", "redis_data"),
            _td.path() / "rb-1" / "volumes" / "redis_data.tar.gz");
}

TEST_F(VolumeArchiverTest, FailureAbortsWholeBackup) {
  _rt.failOn("export_volume", "grafana_data");
  _rt.setVolumeData("third", "x");
  VolumeArchiver va(_rt, _td.path());

  EXPECT_THROW(va.backup("rb-1", {"redis_data", "grafana_data", "third"}), CreationError);
  EXPECT_EQ(_rt.calls("export_volume", "third"), 0);
}

TEST_F(VolumeArchiverTest, InvalidVolumeNameIsRejected) {
  VolumeArchiver va(_rt, _td.path());
  EXPECT_THROW(va.backup("rb-1", {"../escape"}), CreationError);
  EXPECT_EQ(_rt.calls("export_volume"), 0);
}

TEST_F(VolumeArchiverTest, RestoreReplacesVolumeContents) {
  VolumeArchiver va(_rt, _td.path());
  va.backup("rb-1", {"redis_data"});
  _rt.setVolumeData("redis_data", "newer data");

  auto vrr = va.restore("rb-1", {"redis_data"});
  EXPECT_EQ(vrr.vRestored, (std::vector<std::string>{"redis_data"}));
  EXPECT_TRUE(vrr.vFailures.empty());
  EXPECT_EQ(_rt.volumeData("redis_data"), "dump.rdb contents");
}

TEST_F(VolumeArchiverTest, MissingArchiveIsReportedAndOthersContinue) {
  VolumeArchiver va(_rt, _td.path());
  va.backup("rb-1", {"grafana_data"});

  auto vrr = va.restore("rb-1", {"redis_data", "grafana_data"});
  ASSERT_EQ(vrr.vFailures.size(), 1u);
  EXPECT_EQ(vrr.vFailures[0].sSubject, "redis_data");
  EXPECT_EQ(vrr.vRestored, (std::vector<std::string>{"grafana_data"}));
  EXPECT_EQ(_rt.calls("import_volume", "redis_data"), 0);
}

TEST_F(VolumeArchiverTest, ImportFailureIsReported) {
  VolumeArchiver va(_rt, _td.path());
  va.backup("rb-1", {"redis_data"});
  _rt.failOn("import_volume", "redis_data");

  auto vrr = va.restore("rb-1", {"redis_data"});
  ASSERT_EQ(vrr.vFailures.size(), 1u);
  EXPECT_EQ(vrr.vFailures[0].sOperation, "import_volume");
}

TEST(VolumeNameTest, AcceptsDockerVolumeNames) {
  EXPECT_TRUE(VolumeArchiver::isValidVolumeName("prime_redis-data.v1"));
  EXPECT_FALSE(VolumeArchiver::isValidVolumeName(""));
  EXPECT_FALSE(VolumeArchiver::isValidVolumeName("a/b"));
  EXPECT_FALSE(VolumeArchiver::isValidVolumeName(".hidden"));
}
