#include "database/Queries/PgQuotaStore.hpp"
#include "database/Transactions.hpp"

using namespace cf::database;
using namespace cf::types;

std::optional<UserQuota> PgQuotaStore::get(const std::string& userId) const {
    return Transactions::exec("PgQuotaStore::get", [&](pqxx::work& txn) -> std::optional<UserQuota> {
        const auto res = txn.exec(pqxx::prepped{"get_user_quota"}, pqxx::params{userId});
        if (res.empty()) return std::nullopt;
        return UserQuota(res.one_row());
    });
}

void PgQuotaStore::upsert(const UserQuota& quota) {
    Transactions::exec("PgQuotaStore::upsert", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"upsert_user_quota"}, pqxx::params{quota.user_id, quota.ceiling, quota.consumed});
    });
}
