#include "types/Share.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/result>
#include <stdexcept>

namespace cf::types {

Share::Share(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      file_id(row["file_id"].as<std::string>()),
      issued_by(row["user_id"].as<std::string>()),
      token(row["share_token"].as<std::string>()),
      password_hash(row["password_hash"].as<std::optional<std::string>>()),
      access(shareAccessFromString(row["access_type"].as<std::string>())),
      max_downloads(row["max_downloads"].as<std::optional<unsigned int>>()),
      download_count(row["download_count"].as<unsigned int>()),
      is_active(row["is_active"].as<bool>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {
    if (!row["expires_at"].is_null())
        expires_at = util::parsePostgresTimestamp(row["expires_at"].as<std::string>());
}

std::string to_string(const ShareAccess access) {
    switch (access) {
        case ShareAccess::View: return "view";
        case ShareAccess::Download: return "download";
        case ShareAccess::Edit: return "edit";
    }
    return "view";
}

ShareAccess shareAccessFromString(const std::string& s) {
    if (s == "view") return ShareAccess::View;
    if (s == "download") return ShareAccess::Download;
    if (s == "edit") return ShareAccess::Edit;
    throw std::invalid_argument("[Share] Unknown access type: " + s);
}

std::vector<Share> shares_from_pq_res(const pqxx::result& res) {
    std::vector<Share> shares;
    shares.reserve(res.size());
    for (const auto& row : res) shares.emplace_back(row);
    return shares;
}

void to_json(nlohmann::json& j, const Share& s) {
    j = {
        {"id", s.id},
        {"file_id", s.file_id},
        {"user_id", s.issued_by},
        {"share_token", s.token},
        {"has_password", s.password_hash.has_value()},
        {"access_type", to_string(s.access)},
        {"download_count", s.download_count},
        {"is_active", s.is_active},
        {"created_at", util::timestampToString(s.created_at)}
    };
    j["expires_at"] = s.expires_at ? nlohmann::json(util::timestampToString(*s.expires_at)) : nlohmann::json(nullptr);
    j["max_downloads"] = s.max_downloads ? nlohmann::json(*s.max_downloads) : nlohmann::json(nullptr);
}

}
