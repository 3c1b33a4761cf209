#pragma once

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "runtime/IContainerRuntime.hpp"

namespace rwd::test {

/// In-memory container runtime for unit tests. Thread-safe; every call is
/// counted per operation name so tests can assert what was (not) invoked.
/// Volumes are plain strings written to / read from the archive file.
class FakeRuntime : public runtime::IContainerRuntime {
 public:
  void addService(const std::string& sService, const std::string& sImage, bool bRunning = true,
                  std::vector<std::string> vVolumes = {}) {
    std::lock_guard<std::mutex> lock(_mtx);
    _vOrder.push_back(sService);
    _mServices[sService] = Service{sImage, bRunning, std::move(vVolumes)};
  }

  /// Simulate a deploy that changed the running image.
  void setImage(const std::string& sService, const std::string& sImage) {
    std::lock_guard<std::mutex> lock(_mtx);
    _mServices.at(sService).sImage = sImage;
  }

  void setRunning(const std::string& sService, bool bRunning) {
    std::lock_guard<std::mutex> lock(_mtx);
    _mServices.at(sService).bRunning = bRunning;
  }

  void setVolumeData(const std::string& sVolume, const std::string& sData) {
    std::lock_guard<std::mutex> lock(_mtx);
    _mVolumes[sVolume] = sData;
  }

  std::string volumeData(const std::string& sVolume) const {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mVolumes.find(sVolume);
    return it == _mVolumes.end() ? std::string{} : it->second;
  }

  /// Make the named operation fail for a subject (service or volume).
  void failOn(const std::string& sOperation, const std::string& sSubject) {
    std::lock_guard<std::mutex> lock(_mtx);
    _setFailures.insert(sOperation + ":" + sSubject);
  }

  void setExecResult(const std::string& sService, const common::CommandResult& cr) {
    std::lock_guard<std::mutex> lock(_mtx);
    _mExecResults[sService] = cr;
  }

  int calls(const std::string& sOperation) const {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mCalls.find(sOperation);
    return it == _mCalls.end() ? 0 : it->second;
  }

  int calls(const std::string& sOperation, const std::string& sSubject) const {
    return calls(sOperation + ":" + sSubject);
  }

  std::vector<std::vector<std::string>> execLog(const std::string& sService) const {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mExecLog.find(sService);
    return it == _mExecLog.end() ? std::vector<std::vector<std::string>>{} : it->second;
  }

  // ── IContainerRuntime ────────────────────────────────────────────────────

  std::string name() const override { return "fake"; }

  std::vector<std::string> listServices() override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("list_services", "");
    return _vOrder;
  }

  std::optional<std::string> getImage(const std::string& sService) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("get_image", sService);
    auto it = _mServices.find(sService);
    if (it == _mServices.end() || it->second.sImage.empty()) return std::nullopt;
    return it->second.sImage;
  }

  bool isRunning(const std::string& sService) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("is_running", sService);
    auto it = _mServices.find(sService);
    return it != _mServices.end() && it->second.bRunning;
  }

  bool stop(const std::string& sService) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("stop", sService);
    if (failing("stop", sService) || !_mServices.count(sService)) return false;
    _mServices[sService].bRunning = false;
    return true;
  }

  bool start(const std::string& sService) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("start", sService);
    if (failing("start", sService) || !_mServices.count(sService)) return false;
    _mServices[sService].bRunning = true;
    return true;
  }

  bool restoreImage(const std::string& sService, const std::string& sImage) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("restore_image", sService);
    if (failing("restore_image", sService) || !_mServices.count(sService)) return false;
    _mServices[sService].sImage = sImage;
    return true;
  }

  std::vector<std::string> listVolumes(const std::string& sService) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("list_volumes", sService);
    auto it = _mServices.find(sService);
    return it == _mServices.end() ? std::vector<std::string>{} : it->second.vVolumes;
  }

  bool exportVolume(const std::string& sVolume, const std::filesystem::path& pathDest) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("export_volume", sVolume);
    if (failing("export_volume", sVolume)) return false;
    std::ofstream ofs(pathDest, std::ios::binary | std::ios::trunc);
    ofs << _mVolumes[sVolume];
    return ofs.good();
  }

  bool importVolume(const std::string& sVolume, const std::filesystem::path& pathSrc) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("import_volume", sVolume);
    if (failing("import_volume", sVolume)) return false;
    std::ifstream ifs(pathSrc, std::ios::binary);
    if (!ifs.is_open()) return false;
    _mVolumes[sVolume] =
        std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return true;
  }

  common::CommandResult exec(const std::string& sService, const std::vector<std::string>& vArgv,
                             std::chrono::milliseconds /*durTimeout*/) override {
    std::lock_guard<std::mutex> lock(_mtx);
    count("exec", sService);
    _mExecLog[sService].push_back(vArgv);
    auto it = _mExecResults.find(sService);
    if (it != _mExecResults.end()) return it->second;
    common::CommandResult cr;
    cr.iExitCode = 0;
    return cr;
  }

 private:
  struct Service {
    std::string sImage;
    bool bRunning = true;
    std::vector<std::string> vVolumes;
  };

  // Caller holds _mtx
  void count(const std::string& sOperation, const std::string& sSubject) {
    ++_mCalls[sOperation];
    if (!sSubject.empty()) ++_mCalls[sOperation + ":" + sSubject];
  }

  bool failing(const std::string& sOperation, const std::string& sSubject) const {
    return _setFailures.count(sOperation + ":" + sSubject) > 0;
  }

  mutable std::mutex _mtx;
  std::vector<std::string> _vOrder;
  std::map<std::string, Service> _mServices;
  std::map<std::string, std::string> _mVolumes;
  std::set<std::string> _setFailures;
  std::map<std::string, common::CommandResult> _mExecResults;
  std::map<std::string, std::vector<std::vector<std::string>>> _mExecLog;
  std::map<std::string, int> _mCalls;
};

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    static std::mutex mtxCounter;
    static int iCounter = 0;
    int iN = 0;
    {
      std::lock_guard<std::mutex> lock(mtxCounter);
      iN = ++iCounter;
    }
    std::ostringstream oss;
    oss << "rewind-test-" << ::getpid() << "-" << iN;
    _path = std::filesystem::temp_directory_path() / oss.str();
    std::filesystem::remove_all(_path);
    std::filesystem::create_directories(_path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return _path; }

 private:
  std::filesystem::path _path;
};

inline void writeFile(const std::filesystem::path& path, const std::string& sContent) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << sContent;
}

inline std::string readFile(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

}  // namespace rwd::test
