#include "database/DBConnection.hpp"

using namespace cf::database;

void DBConnection::initPreparedVersions() const {
    conn_->prepare("get_latest_version_number",
                   "SELECT MAX(version_number) FROM file_versions WHERE file_id = $1");

    conn_->prepare("insert_file_version",
                   "INSERT INTO file_versions (id, file_id, version_number, file_size, file_hash, storage_path, "
                   "mime_type, created_by, created_at) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp($9) AT TIME ZONE 'UTC')");

    conn_->prepare("get_file_version",
                   "SELECT * FROM file_versions WHERE file_id = $1 AND version_number = $2");

    conn_->prepare("list_file_versions",
                   "SELECT * FROM file_versions WHERE file_id = $1 ORDER BY version_number");

    conn_->prepare("delete_file_version",
                   "DELETE FROM file_versions WHERE file_id = $1 AND version_number = $2");

    conn_->prepare("delete_all_file_versions", "DELETE FROM file_versions WHERE file_id = $1");
}
