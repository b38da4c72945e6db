#include "database/DBConnection.hpp"

using namespace cf::database;

void DBConnection::initPreparedQuotas() const {
    conn_->prepare("get_user_quota", "SELECT * FROM user_quotas WHERE user_id = $1");

    conn_->prepare("upsert_user_quota",
                   "INSERT INTO user_quotas (user_id, storage_ceiling, consumed_bytes) VALUES ($1, $2, $3) "
                   "ON CONFLICT (user_id) DO UPDATE SET "
                   "storage_ceiling = EXCLUDED.storage_ceiling, "
                   "consumed_bytes = EXCLUDED.consumed_bytes");
}
