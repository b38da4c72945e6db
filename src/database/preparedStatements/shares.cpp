#include "database/DBConnection.hpp"

using namespace cf::database;

void DBConnection::initPreparedShares() const {
    conn_->prepare("get_share_by_id", "SELECT * FROM shares WHERE id = $1");

    conn_->prepare("get_share_by_token", "SELECT * FROM shares WHERE share_token = $1");

    conn_->prepare("share_token_exists", "SELECT EXISTS(SELECT 1 FROM shares WHERE share_token = $1)");

    conn_->prepare("insert_share",
                   "INSERT INTO shares (id, file_id, user_id, share_token, password_hash, access_type, expires_at, "
                   "max_downloads, download_count, is_active, created_at) "
                   "VALUES ($1, $2, $3, $4, $5, $6, to_timestamp($7) AT TIME ZONE 'UTC', $8, $9, $10, "
                   "to_timestamp($11) AT TIME ZONE 'UTC')");

    conn_->prepare("set_share_active", "UPDATE shares SET is_active = $2 WHERE id = $1");

    // Revocation is terminal, so an inactive share is never rewritten.
    conn_->prepare("update_share",
                   "UPDATE shares SET password_hash = $2, access_type = $3, "
                   "expires_at = to_timestamp($4) AT TIME ZONE 'UTC', max_downloads = $5 "
                   "WHERE id = $1 AND is_active RETURNING id");

    // Row lock on the share serializes concurrent increments across processes.
    conn_->prepare("try_increment_share_downloads",
                   "UPDATE shares SET download_count = download_count + 1 "
                   "WHERE id = $1 AND is_active AND (max_downloads IS NULL OR download_count < max_downloads) "
                   "RETURNING download_count");

    conn_->prepare("list_shares_for_file", "SELECT * FROM shares WHERE file_id = $1 ORDER BY created_at");

    conn_->prepare("list_shares_for_user", "SELECT * FROM shares WHERE user_id = $1 ORDER BY created_at");
}
