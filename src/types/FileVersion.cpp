#include "types/FileVersion.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/result>

namespace cf::types {

FileVersion::FileVersion(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      file_id(row["file_id"].as<std::string>()),
      version_number(row["version_number"].as<unsigned int>()),
      size_bytes(row["file_size"].as<uintmax_t>()),
      content_hash(row["file_hash"].as<std::string>()),
      storage_key(row["storage_path"].as<std::string>()),
      mime_type(row["mime_type"].as<std::string>()),
      created_by(row["created_by"].as<std::string>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

std::vector<FileVersion> file_versions_from_pq_res(const pqxx::result& res) {
    std::vector<FileVersion> versions;
    versions.reserve(res.size());
    for (const auto& row : res) versions.emplace_back(row);
    return versions;
}

void to_json(nlohmann::json& j, const FileVersion& v) {
    j = {
        {"id", v.id},
        {"file_id", v.file_id},
        {"version_number", v.version_number},
        {"file_size", v.size_bytes},
        {"file_hash", v.content_hash},
        {"mime_type", v.mime_type},
        {"created_by", v.created_by},
        {"created_at", util::timestampToString(v.created_at)}
    };
}

}
