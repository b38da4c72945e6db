#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; class result; }

namespace cf::types {

enum class ShareAccess { View, Download, Edit };

struct Share {
    std::string id;
    std::string file_id;
    std::string issued_by;
    std::string token;
    std::optional<std::string> password_hash; // Argon2id, set before the record is written
    ShareAccess access = ShareAccess::View;
    std::optional<std::time_t> expires_at;
    std::optional<unsigned int> max_downloads;
    unsigned int download_count = 0;
    bool is_active = true;
    std::time_t created_at = 0;

    Share() = default;
    explicit Share(const pqxx::row& row);

    [[nodiscard]] bool exhausted() const { return max_downloads && download_count >= *max_downloads; }
    [[nodiscard]] bool expired(const std::time_t now) const { return expires_at && now > *expires_at; }
};

[[nodiscard]] std::string to_string(ShareAccess access);
[[nodiscard]] ShareAccess shareAccessFromString(const std::string& s);

std::vector<Share> shares_from_pq_res(const pqxx::result& res);

// Never includes the token's password hash.
void to_json(nlohmann::json& j, const Share& s);

}
