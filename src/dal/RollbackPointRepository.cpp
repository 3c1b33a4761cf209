#include "dal/RollbackPointRepository.hpp"

#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "dal/FileLock.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <numeric>

namespace rwd::dal {

namespace {
constexpr const char* kIndexFile = "rollback_index.json";
constexpr const char* kIndexLockFile = ".index.lock";
constexpr const char* kPointsKey = "rollback_points";
}  // namespace

RollbackPointRepository::RollbackPointRepository(std::filesystem::path pathBackupRoot)
    : _pathBackupRoot(std::move(pathBackupRoot)) {
  std::error_code ec;
  std::filesystem::create_directories(_pathBackupRoot, ec);
  if (ec) {
    throw common::RepositoryError("backup_root_unwritable",
                                  "Cannot create backup root " + _pathBackupRoot.string() +
                                      ": " + ec.message());
  }
}

RollbackPointRepository::~RollbackPointRepository() = default;

std::filesystem::path RollbackPointRepository::indexPath() const {
  return _pathBackupRoot / kIndexFile;
}

std::filesystem::path RollbackPointRepository::lockPath() const {
  return _pathBackupRoot / kIndexLockFile;
}

std::filesystem::path RollbackPointRepository::pointDirectory(const std::string& sId) const {
  return _pathBackupRoot / sId;
}

// ── Index I/O ──────────────────────────────────────────────────────────────

std::vector<common::RollbackPoint> RollbackPointRepository::loadUnlocked() const {
  const auto pathIndex = indexPath();
  std::error_code ec;
  if (!std::filesystem::exists(pathIndex, ec)) {
    if (ec) {
      throw common::RepositoryError("index_unreadable",
                                    "Cannot stat " + pathIndex.string() + ": " + ec.message());
    }
    return {};
  }

  std::ifstream ifs(pathIndex);
  if (!ifs.is_open()) {
    throw common::RepositoryError("index_unreadable", "Cannot open " + pathIndex.string());
  }

  try {
    const auto jIndex = nlohmann::json::parse(ifs);
    if (!jIndex.is_object()) {
      throw common::RepositoryError("index_corrupt",
                                    pathIndex.string() + " is not a JSON object");
    }
    if (!jIndex.contains(kPointsKey)) {
      return {};
    }
    return jIndex.at(kPointsKey).get<std::vector<common::RollbackPoint>>();
  } catch (const nlohmann::json::exception& ex) {
    throw common::RepositoryError("index_corrupt",
                                  "Rollback index " + pathIndex.string() +
                                      " is corrupt: " + ex.what());
  }
}

void RollbackPointRepository::saveUnlocked(
    const std::vector<common::RollbackPoint>& vPoints) const {
  const auto pathIndex = indexPath();
  auto pathTmp = pathIndex;
  pathTmp += ".tmp";

  std::string sSerialized;
  try {
    nlohmann::json jIndex = {
        {kPointsKey, vPoints},
        {"last_updated", common::utcTimestamp()},
    };
    sSerialized = jIndex.dump(2);
  } catch (const nlohmann::json::exception& ex) {
    throw common::RepositoryError("index_serialize_failed",
                                  std::string("Cannot serialize rollback index: ") + ex.what());
  }

  {
    std::ofstream ofs(pathTmp, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
      throw common::RepositoryError("index_write_failed", "Cannot open " + pathTmp.string());
    }
    ofs << sSerialized << '\n';
    ofs.flush();
    if (!ofs.good()) {
      ofs.close();
      std::error_code ecIgnored;
      std::filesystem::remove(pathTmp, ecIgnored);
      throw common::RepositoryError("index_write_failed", "Short write to " + pathTmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(pathTmp, pathIndex, ec);
  if (ec) {
    std::error_code ecIgnored;
    std::filesystem::remove(pathTmp, ecIgnored);
    throw common::RepositoryError("index_write_failed",
                                  "Cannot replace " + pathIndex.string() + ": " + ec.message());
  }
}

bool RollbackPointRepository::removeDirectory(const std::string& sId) const {
  std::error_code ec;
  std::filesystem::remove_all(pointDirectory(sId), ec);
  if (ec) {
    common::Logger::get()->warn("Index entry {} removed but its directory could not be: {}",
                                sId, ec.message());
    return false;
  }
  return true;
}

std::vector<common::RollbackPoint> RollbackPointRepository::newestFirst(
    std::vector<common::RollbackPoint> vInsertionOrder) {
  std::vector<size_t> vOrder(vInsertionOrder.size());
  std::iota(vOrder.begin(), vOrder.end(), 0);
  std::sort(vOrder.begin(), vOrder.end(), [&vInsertionOrder](size_t a, size_t b) {
    const auto& sA = vInsertionOrder[a].sTimestamp;
    const auto& sB = vInsertionOrder[b].sTimestamp;
    if (sA != sB) return sA > sB;
    return a > b;
  });

  std::vector<common::RollbackPoint> vResult;
  vResult.reserve(vOrder.size());
  for (size_t n : vOrder) {
    vResult.push_back(std::move(vInsertionOrder[n]));
  }
  return vResult;
}

// ── Public operations ──────────────────────────────────────────────────────

void RollbackPointRepository::append(const common::RollbackPoint& rpPoint) {
  FileLock fl(lockPath(), FileLock::Mode::Exclusive);

  auto vPoints = loadUnlocked();
  const bool bDuplicate = std::any_of(vPoints.begin(), vPoints.end(),
                                      [&rpPoint](const auto& rp) { return rp.sId == rpPoint.sId; });
  if (bDuplicate) {
    throw common::RepositoryError("duplicate_id",
                                  "Rollback point id already indexed: " + rpPoint.sId);
  }

  vPoints.push_back(rpPoint);
  saveUnlocked(vPoints);
}

std::vector<common::RollbackPoint> RollbackPointRepository::list() const {
  FileLock fl(lockPath(), FileLock::Mode::Shared);
  return newestFirst(loadUnlocked());
}

common::RollbackPoint RollbackPointRepository::get(const std::string& sId) const {
  FileLock fl(lockPath(), FileLock::Mode::Shared);
  for (auto& rp : loadUnlocked()) {
    if (rp.sId == sId) {
      return rp;
    }
  }
  throw common::NotFoundError("rollback_point_not_found", "Rollback point not found: " + sId);
}

bool RollbackPointRepository::contains(const std::string& sId) const {
  FileLock fl(lockPath(), FileLock::Mode::Shared);
  const auto vPoints = loadUnlocked();
  return std::any_of(vPoints.begin(), vPoints.end(),
                     [&sId](const auto& rp) { return rp.sId == sId; });
}

bool RollbackPointRepository::remove(const std::string& sId) {
  FileLock fl(lockPath(), FileLock::Mode::Exclusive);

  auto vPoints = loadUnlocked();
  auto it = std::find_if(vPoints.begin(), vPoints.end(),
                         [&sId](const auto& rp) { return rp.sId == sId; });
  if (it == vPoints.end()) {
    return false;
  }

  vPoints.erase(it);
  saveUnlocked(vPoints);
  const bool bClean = removeDirectory(sId);

  common::Logger::get()->info("Deleted rollback point {}{}", sId,
                              bClean ? "" : " (directory left behind)");
  return true;
}

common::RetentionReport RollbackPointRepository::enforceRetention(int iMaxPoints) {
  common::RetentionReport ret;
  if (iMaxPoints < 1) {
    return ret;
  }

  FileLock fl(lockPath(), FileLock::Mode::Exclusive);
  auto spLog = common::Logger::get();

  auto vRemaining = loadUnlocked();
  const auto vOrdered = newestFirst(vRemaining);
  if (vOrdered.size() <= static_cast<size_t>(iMaxPoints)) {
    return ret;
  }

  // Oldest first, so an interrupted pass still removes the stalest points
  for (auto it = vOrdered.rbegin(); it != vOrdered.rend() - iMaxPoints; ++it) {
    const std::string& sId = it->sId;
    try {
      std::vector<common::RollbackPoint> vNext;
      vNext.reserve(vRemaining.size());
      std::copy_if(vRemaining.begin(), vRemaining.end(), std::back_inserter(vNext),
                   [&sId](const auto& rp) { return rp.sId != sId; });
      saveUnlocked(vNext);
      vRemaining = std::move(vNext);
      if (!removeDirectory(sId)) {
        ret.vFailed.push_back(sId);
        continue;
      }
      ret.vEvicted.push_back(sId);
      spLog->info("Retention: evicted rollback point {} ({})", sId, it->sTimestamp);
    } catch (const std::exception& ex) {
      ret.vFailed.push_back(sId);
      spLog->warn("Retention: failed to evict rollback point {}: {}", sId, ex.what());
    }
  }

  return ret;
}

}  // namespace rwd::dal
