#include "types/UserQuota.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>

namespace cf::types {

UserQuota::UserQuota(std::string userId, const uintmax_t ceiling, const uintmax_t consumed)
    : user_id(std::move(userId)), ceiling(ceiling), consumed(consumed) {}

UserQuota::UserQuota(const pqxx::row& row)
    : user_id(row["user_id"].as<std::string>()),
      ceiling(row["storage_ceiling"].as<uintmax_t>()),
      consumed(row["consumed_bytes"].as<uintmax_t>()) {}

void to_json(nlohmann::json& j, const UserQuota& q) {
    j = {
        {"user_id", q.user_id},
        {"storage_ceiling", q.ceiling},
        {"consumed_bytes", q.consumed}
    };
}

void to_json(nlohmann::json& j, const QuotaUsage& u) {
    j = {
        {"ceiling", u.ceiling},
        {"consumed", u.consumed},
        {"reserved", u.reserved},
        {"available", u.available()}
    };
}

}
