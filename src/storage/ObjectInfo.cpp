#include "storage/ObjectInfo.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

void cf::storage::to_json(nlohmann::json& j, const ObjectInfo& info) {
    j = {
        {"key", info.key},
        {"size", info.size},
        {"last_modified", util::timestampToString(info.last_modified)},
        {"is_dir", info.is_dir},
        {"mime_type", info.mime_type},
        {"etag", info.etag}
    };
    if (!info.content_hash.empty()) j["content_hash"] = info.content_hash;
}
