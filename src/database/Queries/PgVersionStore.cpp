#include "database/Queries/PgVersionStore.hpp"
#include "database/Transactions.hpp"

using namespace cf::database;
using namespace cf::types;

std::optional<unsigned int> PgVersionStore::latestNumber(const std::string& fileId) const {
    return Transactions::exec("PgVersionStore::latestNumber", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"get_latest_version_number"}, pqxx::params{fileId})
            .one_field().as<std::optional<unsigned int>>();
    });
}

void PgVersionStore::insert(const FileVersion& version) {
    Transactions::exec("PgVersionStore::insert", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(version.id);
        p.append(version.file_id);
        p.append(version.version_number);
        p.append(version.size_bytes);
        p.append(version.content_hash);
        p.append(version.storage_key);
        p.append(version.mime_type);
        p.append(version.created_by);
        p.append(version.created_at);

        txn.exec(pqxx::prepped{"insert_file_version"}, p);
    });
}

std::optional<FileVersion> PgVersionStore::get(const std::string& fileId, const unsigned int number) const {
    return Transactions::exec("PgVersionStore::get", [&](pqxx::work& txn) -> std::optional<FileVersion> {
        const auto res = txn.exec(pqxx::prepped{"get_file_version"}, pqxx::params{fileId, number});
        if (res.empty()) return std::nullopt;
        return FileVersion(res.one_row());
    });
}

std::vector<FileVersion> PgVersionStore::list(const std::string& fileId) const {
    return Transactions::exec("PgVersionStore::list", [&](pqxx::work& txn) {
        return file_versions_from_pq_res(txn.exec(pqxx::prepped{"list_file_versions"}, pqxx::params{fileId}));
    });
}

void PgVersionStore::remove(const std::string& fileId, const unsigned int number) {
    Transactions::exec("PgVersionStore::remove", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_file_version"}, pqxx::params{fileId, number});
    });
}

void PgVersionStore::removeAll(const std::string& fileId) {
    Transactions::exec("PgVersionStore::removeAll", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_all_file_versions"}, pqxx::params{fileId});
    });
}
