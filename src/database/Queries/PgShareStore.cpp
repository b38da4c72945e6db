#include "database/Queries/PgShareStore.hpp"
#include "database/Transactions.hpp"

using namespace cf::database;
using namespace cf::types;

std::optional<Share> PgShareStore::get(const std::string& id) const {
    return Transactions::exec("PgShareStore::get", [&](pqxx::work& txn) -> std::optional<Share> {
        const auto res = txn.exec(pqxx::prepped{"get_share_by_id"}, pqxx::params{id});
        if (res.empty()) return std::nullopt;
        return Share(res.one_row());
    });
}

std::optional<Share> PgShareStore::getByToken(const std::string& token) const {
    return Transactions::exec("PgShareStore::getByToken", [&](pqxx::work& txn) -> std::optional<Share> {
        const auto res = txn.exec(pqxx::prepped{"get_share_by_token"}, pqxx::params{token});
        if (res.empty()) return std::nullopt;
        return Share(res.one_row());
    });
}

bool PgShareStore::tokenExists(const std::string& token) const {
    return Transactions::exec("PgShareStore::tokenExists", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"share_token_exists"}, pqxx::params{token}).one_field().as<bool>();
    });
}

void PgShareStore::insert(const Share& share) {
    Transactions::exec("PgShareStore::insert", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(share.id);
        p.append(share.file_id);
        p.append(share.issued_by);
        p.append(share.token);
        p.append(share.password_hash);
        p.append(to_string(share.access));
        p.append(share.expires_at);
        p.append(share.max_downloads);
        p.append(share.download_count);
        p.append(share.is_active);
        p.append(share.created_at);

        txn.exec(pqxx::prepped{"insert_share"}, p);
    });
}

void PgShareStore::setActive(const std::string& id, const bool active) {
    Transactions::exec("PgShareStore::setActive", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"set_share_active"}, pqxx::params{id, active});
    });
}

bool PgShareStore::update(const Share& share) {
    return Transactions::exec("PgShareStore::update", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(share.id);
        p.append(share.password_hash);
        p.append(to_string(share.access));
        p.append(share.expires_at);
        p.append(share.max_downloads);

        return !txn.exec(pqxx::prepped{"update_share"}, p).empty();
    });
}

bool PgShareStore::tryIncrementDownloads(const std::string& id) {
    return Transactions::exec("PgShareStore::tryIncrementDownloads", [&](pqxx::work& txn) {
        return !txn.exec(pqxx::prepped{"try_increment_share_downloads"}, pqxx::params{id}).empty();
    });
}

std::vector<Share> PgShareStore::listForFile(const std::string& fileId) const {
    return Transactions::exec("PgShareStore::listForFile", [&](pqxx::work& txn) {
        return shares_from_pq_res(txn.exec(pqxx::prepped{"list_shares_for_file"}, pqxx::params{fileId}));
    });
}

std::vector<Share> PgShareStore::listForUser(const std::string& userId) const {
    return Transactions::exec("PgShareStore::listForUser", [&](pqxx::work& txn) {
        return shares_from_pq_res(txn.exec(pqxx::prepped{"list_shares_for_user"}, pqxx::params{userId}));
    });
}
