#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace cf::types {

// Resolved by the caller's auth layer; the core never authenticates.
struct UserIdentity {
    std::string id;
    uintmax_t storage_ceiling = 0; // 0: fall back to the configured default
};

struct UserQuota {
    std::string user_id;
    uintmax_t ceiling = 0;
    uintmax_t consumed = 0;

    UserQuota() = default;
    UserQuota(std::string userId, uintmax_t ceiling, uintmax_t consumed);
    explicit UserQuota(const pqxx::row& row);
};

// Snapshot including in-flight reservations.
struct QuotaUsage {
    uintmax_t ceiling = 0;
    uintmax_t consumed = 0;
    uintmax_t reserved = 0;

    [[nodiscard]] uintmax_t available() const {
        const auto used = consumed + reserved;
        return used >= ceiling ? 0 : ceiling - used;
    }
};

void to_json(nlohmann::json& j, const UserQuota& q);
void to_json(nlohmann::json& j, const QuotaUsage& u);

}
