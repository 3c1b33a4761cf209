#include "runtime/DockerComposeRuntime.hpp"

#include "common/Logger.hpp"
#include "common/Subprocess.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace rwd::runtime {

namespace {

constexpr const char* kVolumeMount = "/data";
constexpr const char* kBackupMount = "/backup";

std::string firstLine(const std::string& sText) {
  const auto nEnd = sText.find('\n');
  return nEnd == std::string::npos ? sText : sText.substr(0, nEnd);
}

DockerComposeRuntime::ContainerEntry toEntry(const nlohmann::json& j) {
  DockerComposeRuntime::ContainerEntry ce;
  ce.sService = j.value("Service", std::string{});
  ce.sName = j.value("Name", std::string{});
  ce.sImage = j.value("Image", std::string{});
  ce.sState = j.value("State", std::string{});
  return ce;
}

}  // namespace

DockerComposeRuntime::DockerComposeRuntime(std::filesystem::path pathProjectRoot,
                                           std::vector<std::string> vComposeCommand,
                                           std::vector<std::string> vDockerCommand,
                                           std::string sVolumeHelperImage,
                                           std::chrono::milliseconds durCommandTimeout)
    : _pathProjectRoot(std::move(pathProjectRoot)),
      _vComposeCommand(std::move(vComposeCommand)),
      _vDockerCommand(std::move(vDockerCommand)),
      _sVolumeHelperImage(std::move(sVolumeHelperImage)),
      _durCommandTimeout(durCommandTimeout) {}

DockerComposeRuntime::~DockerComposeRuntime() = default;

std::string DockerComposeRuntime::name() const { return "docker-compose"; }

// ── CLI plumbing ───────────────────────────────────────────────────────────

common::CommandResult DockerComposeRuntime::compose(
    const std::vector<std::string>& vArgs, std::optional<std::chrono::milliseconds> oTimeout) {
  std::vector<std::string> vArgv = _vComposeCommand;
  vArgv.insert(vArgv.end(), vArgs.begin(), vArgs.end());
  return common::Subprocess::run(vArgv, oTimeout.value_or(_durCommandTimeout),
                                 _pathProjectRoot.string());
}

common::CommandResult DockerComposeRuntime::docker(const std::vector<std::string>& vArgs) {
  std::vector<std::string> vArgv = _vDockerCommand;
  vArgv.insert(vArgv.end(), vArgs.begin(), vArgs.end());
  return common::Subprocess::run(vArgv, _durCommandTimeout, _pathProjectRoot.string());
}

bool DockerComposeRuntime::report(const char* pOperation, const std::string& sSubject,
                                  const common::CommandResult& cr) const {
  if (cr.ok()) {
    return true;
  }
  auto spLog = common::Logger::get();
  if (cr.bTimedOut) {
    spLog->warn("{} {}: timed out after {}ms", pOperation, sSubject, _durCommandTimeout.count());
  } else {
    spLog->warn("{} {}: exit {} ({})", pOperation, sSubject, cr.iExitCode,
                firstLine(cr.sStderr));
  }
  return false;
}

// ── Parsing ────────────────────────────────────────────────────────────────

std::vector<DockerComposeRuntime::ContainerEntry> DockerComposeRuntime::parsePsOutput(
    const std::string& sOutput) {
  std::vector<ContainerEntry> vEntries;

  const auto nFirst = sOutput.find_first_not_of(" \t\r\n");
  if (nFirst == std::string::npos) {
    return vEntries;
  }

  if (sOutput[nFirst] == '[') {
    const auto j = nlohmann::json::parse(sOutput, nullptr, false);
    if (j.is_array()) {
      for (const auto& jItem : j) {
        if (jItem.is_object()) vEntries.push_back(toEntry(jItem));
      }
    }
    return vEntries;
  }

  std::istringstream iss(sOutput);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    const auto j = nlohmann::json::parse(sLine, nullptr, false);
    if (j.is_object()) {
      vEntries.push_back(toEntry(j));
    }
  }
  return vEntries;
}

std::vector<std::string> DockerComposeRuntime::parseVolumeMounts(const std::string& sMountsJson) {
  std::vector<std::string> vVolumes;
  const auto j = nlohmann::json::parse(sMountsJson, nullptr, false);
  if (!j.is_array()) {
    return vVolumes;
  }
  for (const auto& jMount : j) {
    if (!jMount.is_object()) continue;
    if (jMount.value("Type", std::string{}) != "volume") continue;
    const std::string sName = jMount.value("Name", std::string{});
    if (!sName.empty()) {
      vVolumes.push_back(sName);
    }
  }
  return vVolumes;
}

std::optional<DockerComposeRuntime::ContainerEntry> DockerComposeRuntime::findContainer(
    const std::string& sService) {
  const auto cr = compose({"ps", "--all", "--format", "json", sService});
  if (!report("ps", sService, cr)) {
    return std::nullopt;
  }
  for (auto& ce : parsePsOutput(cr.sStdout)) {
    if (ce.sService == sService) {
      return ce;
    }
  }
  return std::nullopt;
}

std::optional<std::string> DockerComposeRuntime::configuredImage(const std::string& sService) {
  const auto cr = compose({"config", "--format", "json"});
  if (!report("config", sService, cr)) {
    return std::nullopt;
  }
  const auto j = nlohmann::json::parse(cr.sStdout, nullptr, false);
  if (!j.is_object() || !j.contains("services")) {
    return std::nullopt;
  }
  const auto& jServices = j.at("services");
  if (!jServices.is_object() || !jServices.contains(sService)) {
    return std::nullopt;
  }
  const auto& jService = jServices.at(sService);
  if (!jService.is_object() || !jService.contains("image") || !jService.at("image").is_string()) {
    return std::nullopt;
  }
  return jService.at("image").get<std::string>();
}

// ── IContainerRuntime ──────────────────────────────────────────────────────

std::vector<std::string> DockerComposeRuntime::listServices() {
  std::vector<std::string> vServices;
  const auto cr = compose({"config", "--services"});
  if (!report("config --services", _pathProjectRoot.string(), cr)) {
    return vServices;
  }
  std::istringstream iss(cr.sStdout);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    if (!sLine.empty() && sLine.back() == '\r') sLine.pop_back();
    if (!sLine.empty()) vServices.push_back(sLine);
  }
  return vServices;
}

std::optional<std::string> DockerComposeRuntime::getImage(const std::string& sService) {
  const auto oEntry = findContainer(sService);
  if (!oEntry || oEntry->sImage.empty()) {
    return std::nullopt;
  }
  return oEntry->sImage;
}

bool DockerComposeRuntime::isRunning(const std::string& sService) {
  const auto oEntry = findContainer(sService);
  return oEntry && oEntry->sState == "running";
}

bool DockerComposeRuntime::stop(const std::string& sService) {
  return report("stop", sService, compose({"stop", sService}));
}

bool DockerComposeRuntime::start(const std::string& sService) {
  return report("start", sService, compose({"up", "-d", sService}));
}

bool DockerComposeRuntime::restoreImage(const std::string& sService, const std::string& sImage) {
  auto spLog = common::Logger::get();

  // A failed pull is tolerable when the image is still present locally
  const auto crPull = docker({"pull", sImage});
  if (!crPull.ok()) {
    const auto crInspect = docker({"image", "inspect", sImage});
    if (!crInspect.ok()) {
      return report("pull", sImage, crPull);
    }
    spLog->debug("pull {} failed, using local copy", sImage);
  }

  const auto oConfigured = configuredImage(sService);
  if (!oConfigured || *oConfigured == sImage) {
    return true;
  }

  spLog->info("Retagging {} as {} for service {}", sImage, *oConfigured, sService);
  return report("tag", sService, docker({"image", "tag", sImage, *oConfigured}));
}

std::vector<std::string> DockerComposeRuntime::listVolumes(const std::string& sService) {
  const auto oEntry = findContainer(sService);
  if (!oEntry || oEntry->sName.empty()) {
    return {};
  }
  const auto cr = docker({"inspect", "--format", "{{json .Mounts}}", oEntry->sName});
  if (!report("inspect", oEntry->sName, cr)) {
    return {};
  }
  return parseVolumeMounts(cr.sStdout);
}

bool DockerComposeRuntime::exportVolume(const std::string& sVolume,
                                        const std::filesystem::path& pathDest) {
  const auto pathDir = std::filesystem::absolute(pathDest).parent_path();
  const std::string sArchive = std::string(kBackupMount) + "/" + pathDest.filename().string();
  return report("export_volume", sVolume,
                docker({"run", "--rm",
                        "-v", sVolume + ":" + kVolumeMount + ":ro",
                        "-v", pathDir.string() + ":" + kBackupMount,
                        _sVolumeHelperImage,
                        "tar", "czf", sArchive, "-C", kVolumeMount, "."}));
}

bool DockerComposeRuntime::importVolume(const std::string& sVolume,
                                        const std::filesystem::path& pathSrc) {
  const auto pathDir = std::filesystem::absolute(pathSrc).parent_path();
  const std::string sArchive = std::string(kBackupMount) + "/" + pathSrc.filename().string();
  const std::string sScript = std::string("find ") + kVolumeMount +
                              " -mindepth 1 -delete && tar xzf " + sArchive + " -C " +
                              kVolumeMount;
  return report("import_volume", sVolume,
                docker({"run", "--rm",
                        "-v", sVolume + ":" + kVolumeMount,
                        "-v", pathDir.string() + ":" + kBackupMount + ":ro",
                        _sVolumeHelperImage,
                        "sh", "-c", sScript}));
}

common::CommandResult DockerComposeRuntime::exec(const std::string& sService,
                                                 const std::vector<std::string>& vArgv,
                                                 std::chrono::milliseconds durTimeout) {
  std::vector<std::string> vArgs = {"exec", "-T", sService};
  vArgs.insert(vArgs.end(), vArgv.begin(), vArgv.end());
  return compose(vArgs, durTimeout);
}

}  // namespace rwd::runtime
