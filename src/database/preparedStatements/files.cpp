#include "database/DBConnection.hpp"

using namespace cf::database;

void DBConnection::initPreparedFiles() const {
    conn_->prepare("get_file_by_id",
                   "SELECT * FROM files WHERE id = $1 AND ($2 OR deleted_at IS NULL)");

    conn_->prepare("list_file_children",
                   "SELECT * FROM files "
                   "WHERE user_id = $1 AND parent_id IS NOT DISTINCT FROM $2 AND ($3 OR deleted_at IS NULL) "
                   "ORDER BY name");

    // Prefer the active row when a tombstoned sibling shares the name.
    conn_->prepare("find_file_child",
                   "SELECT * FROM files "
                   "WHERE user_id = $1 AND parent_id IS NOT DISTINCT FROM $2 AND name = $3 "
                   "AND ($4 OR deleted_at IS NULL) "
                   "ORDER BY deleted_at NULLS FIRST LIMIT 1");

    conn_->prepare("insert_file",
                   "INSERT INTO files (id, user_id, parent_id, name, path, size, mime_type, hash, type, is_public, "
                   "share_token, version, deleted_at, created_at, updated_at, delete_batch) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, "
                   "to_timestamp($13) AT TIME ZONE 'UTC', "
                   "to_timestamp($14) AT TIME ZONE 'UTC', "
                   "to_timestamp($15) AT TIME ZONE 'UTC', $16)");

    conn_->prepare("update_file",
                   "UPDATE files SET user_id = $2, parent_id = $3, name = $4, path = $5, size = $6, "
                   "mime_type = $7, hash = $8, type = $9, is_public = $10, share_token = $11, version = $12, "
                   "deleted_at = to_timestamp($13) AT TIME ZONE 'UTC', "
                   "updated_at = to_timestamp($14) AT TIME ZONE 'UTC', delete_batch = $15 "
                   "WHERE id = $1 RETURNING id");

    conn_->prepare("delete_file", "DELETE FROM files WHERE id = $1");
}
