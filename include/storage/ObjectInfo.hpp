#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cf::storage {

struct ObjectInfo {
    std::string key;
    uintmax_t size = 0;
    std::time_t last_modified = 0;
    bool is_dir = false;
    std::string mime_type;
    std::string etag;
    std::string content_hash; // BLAKE2b hex when the backend knows it

    // What a stored hash should be compared against.
    [[nodiscard]] const std::string& integrityTag() const { return content_hash.empty() ? etag : content_hash; }
};

void to_json(nlohmann::json& j, const ObjectInfo& info);

}
