#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rwd::runtime {

/// Pure abstract interface to the container runtime. The rollback core only
/// calls through this; implementations own their per-call timeouts.
/// Implementations must be safe to call from several worker threads.
class IContainerRuntime {
 public:
  virtual ~IContainerRuntime() = default;

  virtual std::string name() const = 0;

  /// Services currently defined for the deployment.
  virtual std::vector<std::string> listServices() = 0;

  /// Image reference the service is running (or configured) with, if known.
  virtual std::optional<std::string> getImage(const std::string& sService) = 0;

  virtual bool isRunning(const std::string& sService) = 0;
  virtual bool stop(const std::string& sService) = 0;
  virtual bool start(const std::string& sService) = 0;

  /// Make the next start of sService run sImage.
  virtual bool restoreImage(const std::string& sService, const std::string& sImage) = 0;

  /// Named data volumes mounted by the service.
  virtual std::vector<std::string> listVolumes(const std::string& sService) = 0;

  virtual bool exportVolume(const std::string& sVolume,
                            const std::filesystem::path& pathDest) = 0;

  /// Destructive: clears the volume before extracting pathSrc into it.
  virtual bool importVolume(const std::string& sVolume,
                            const std::filesystem::path& pathSrc) = 0;

  /// Run argv inside the service's container.
  virtual common::CommandResult exec(const std::string& sService,
                                     const std::vector<std::string>& vArgv,
                                     std::chrono::milliseconds durTimeout) = 0;
};

}  // namespace rwd::runtime
