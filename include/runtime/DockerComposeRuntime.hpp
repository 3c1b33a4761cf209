#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "runtime/IContainerRuntime.hpp"

namespace rwd::runtime {

/// Docker Compose implementation driving the docker / compose CLIs.
/// Every CLI call is bounded by the configured command timeout.
/// Class abbreviation: dcr
class DockerComposeRuntime : public IContainerRuntime {
 public:
  DockerComposeRuntime(std::filesystem::path pathProjectRoot,
                       std::vector<std::string> vComposeCommand,
                       std::vector<std::string> vDockerCommand,
                       std::string sVolumeHelperImage,
                       std::chrono::milliseconds durCommandTimeout);
  ~DockerComposeRuntime() override;

  std::string name() const override;
  std::vector<std::string> listServices() override;
  std::optional<std::string> getImage(const std::string& sService) override;
  bool isRunning(const std::string& sService) override;
  bool stop(const std::string& sService) override;
  bool start(const std::string& sService) override;
  bool restoreImage(const std::string& sService, const std::string& sImage) override;
  std::vector<std::string> listVolumes(const std::string& sService) override;
  bool exportVolume(const std::string& sVolume,
                    const std::filesystem::path& pathDest) override;
  bool importVolume(const std::string& sVolume,
                    const std::filesystem::path& pathSrc) override;
  common::CommandResult exec(const std::string& sService,
                             const std::vector<std::string>& vArgv,
                             std::chrono::milliseconds durTimeout) override;

  /// One row of `compose ps --format json`.
  struct ContainerEntry {
    std::string sService;
    std::string sName;
    std::string sImage;
    std::string sState;
  };

  /// Accepts both JSON-lines (compose >= 2.21) and a single JSON array.
  /// Lines that are not JSON objects are skipped.
  static std::vector<ContainerEntry> parsePsOutput(const std::string& sOutput);

  /// Names of mounts with Type == "volume" from `docker inspect` .Mounts JSON.
  static std::vector<std::string> parseVolumeMounts(const std::string& sMountsJson);

 private:
  common::CommandResult compose(const std::vector<std::string>& vArgs,
                                std::optional<std::chrono::milliseconds> oTimeout = {});
  common::CommandResult docker(const std::vector<std::string>& vArgs);
  std::optional<ContainerEntry> findContainer(const std::string& sService);
  std::optional<std::string> configuredImage(const std::string& sService);
  bool report(const char* pOperation, const std::string& sSubject,
              const common::CommandResult& cr) const;

  std::filesystem::path _pathProjectRoot;
  std::vector<std::string> _vComposeCommand;
  std::vector<std::string> _vDockerCommand;
  std::string _sVolumeHelperImage;
  std::chrono::milliseconds _durCommandTimeout;
};

}  // namespace rwd::runtime
