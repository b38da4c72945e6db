#pragma once

#include <ctime>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; class result; }

namespace cf::types {

// Immutable once recorded; rollback only moves the file's pointer.
struct FileVersion {
    std::string id;
    std::string file_id;
    unsigned int version_number = 0;
    uintmax_t size_bytes = 0;
    std::string content_hash;
    std::string storage_key;
    std::string mime_type;
    std::string created_by;
    std::time_t created_at = 0;

    FileVersion() = default;
    explicit FileVersion(const pqxx::row& row);
};

std::vector<FileVersion> file_versions_from_pq_res(const pqxx::result& res);

void to_json(nlohmann::json& j, const FileVersion& v);

}
