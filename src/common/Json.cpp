#include "common/Json.hpp"

namespace rwd::common {

void to_json(nlohmann::json& j, const RollbackPoint& rp) {
  j = nlohmann::json{
      {"id", rp.sId},
      {"timestamp", rp.sTimestamp},
      {"description", rp.sDescription},
      {"created_by", rp.sCreatedBy},
      {"services", rp.vServices},
      {"image_references", rp.mImageReferences},
      {"config_hashes", rp.mConfigHashes},
      {"volumes", rp.vVolumes},
      {"metadata", rp.mMetadata},
  };
}

void from_json(const nlohmann::json& j, RollbackPoint& rp) {
  j.at("id").get_to(rp.sId);
  j.at("timestamp").get_to(rp.sTimestamp);
  j.at("description").get_to(rp.sDescription);
  j.at("services").get_to(rp.vServices);
  j.at("image_references").get_to(rp.mImageReferences);
  j.at("config_hashes").get_to(rp.mConfigHashes);

  rp.sCreatedBy = j.value("created_by", std::string("system"));
  if (j.contains("volumes")) {
    j.at("volumes").get_to(rp.vVolumes);
  }
  if (j.contains("metadata")) {
    j.at("metadata").get_to(rp.mMetadata);
  }
}

}  // namespace rwd::common
