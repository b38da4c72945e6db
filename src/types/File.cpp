#include "types/File.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/result>
#include <stdexcept>

namespace cf::types {

File::File(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      owner_id(row["user_id"].as<std::string>()),
      parent_id(row["parent_id"].as<std::optional<std::string>>()),
      name(row["name"].as<std::string>()),
      path(row["path"].as<std::string>()),
      size_bytes(row["size"].as<uintmax_t>()),
      mime_type(row["mime_type"].as<std::string>()),
      content_hash(row["hash"].as<std::string>()),
      kind(fileKindFromString(row["type"].as<std::string>())),
      is_public(row["is_public"].as<bool>()),
      share_token(row["share_token"].as<std::optional<std::string>>()),
      current_version(row["version"].as<unsigned int>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())),
      updated_at(util::parsePostgresTimestamp(row["updated_at"].as<std::string>())) {
    if (!row["deleted_at"].is_null()) {
        lifecycle = Lifecycle::Tombstoned;
        tombstoned_at = util::parsePostgresTimestamp(row["deleted_at"].as<std::string>());
        tombstone_batch = row["delete_batch"].as<std::optional<std::string>>();
    }
}

std::string to_string(const FileKind kind) {
    return kind == FileKind::Directory ? "directory" : "file";
}

FileKind fileKindFromString(const std::string& s) {
    if (s == "file") return FileKind::File;
    if (s == "directory") return FileKind::Directory;
    throw std::invalid_argument("[File] Unknown file kind: " + s);
}

bool matches(const File& f, const Include include) {
    return include == Include::WithTombstoned || f.isActive();
}

std::vector<File> files_from_pq_res(const pqxx::result& res) {
    std::vector<File> files;
    files.reserve(res.size());
    for (const auto& row : res) files.emplace_back(row);
    return files;
}

void to_json(nlohmann::json& j, const File& f) {
    j = {
        {"id", f.id},
        {"user_id", f.owner_id},
        {"parent_id", f.parent_id ? nlohmann::json(*f.parent_id) : nlohmann::json(nullptr)},
        {"name", f.name},
        {"path", f.path},
        {"size", f.size_bytes},
        {"mime_type", f.mime_type},
        {"hash", f.content_hash},
        {"type", to_string(f.kind)},
        {"is_public", f.is_public},
        {"version", f.current_version},
        {"deleted", !f.isActive()},
        {"created_at", util::timestampToString(f.created_at)},
        {"updated_at", util::timestampToString(f.updated_at)}
    };
    if (f.tombstoned_at) j["deleted_at"] = util::timestampToString(*f.tombstoned_at);
}

}
