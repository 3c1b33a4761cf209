#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace rwd::common {

/// nlohmann::json ADL hooks for the persisted index record.
/// Keys: id, timestamp, description, created_by, services, image_references,
/// config_hashes, volumes, metadata.
void to_json(nlohmann::json& j, const RollbackPoint& rp);

/// Throws nlohmann::json::exception on missing keys or wrong types.
/// created_by, volumes and metadata are optional on read.
void from_json(const nlohmann::json& j, RollbackPoint& rp);

}  // namespace rwd::common
