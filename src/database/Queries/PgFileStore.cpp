#include "database/Queries/PgFileStore.hpp"
#include "database/Transactions.hpp"

using namespace cf::database;
using namespace cf::types;

namespace {

bool withTombstoned(const Include include) { return include == Include::WithTombstoned; }

std::optional<std::time_t> deletedAt(const File& f) {
    if (f.isActive()) return std::nullopt;
    return f.tombstoned_at.value_or(f.updated_at);
}

std::optional<std::string> deleteBatch(const File& f) {
    if (f.isActive()) return std::nullopt;
    return f.tombstone_batch;
}

}

std::optional<File> PgFileStore::get(const std::string& id, const Include include) const {
    return Transactions::exec("PgFileStore::get", [&](pqxx::work& txn) -> std::optional<File> {
        const auto res = txn.exec(pqxx::prepped{"get_file_by_id"}, pqxx::params{id, withTombstoned(include)});
        if (res.empty()) return std::nullopt;
        return File(res.one_row());
    });
}

std::vector<File> PgFileStore::children(const std::string& ownerId, const std::optional<std::string>& parentId,
                                        const Include include) const {
    return Transactions::exec("PgFileStore::children", [&](pqxx::work& txn) {
        return files_from_pq_res(txn.exec(pqxx::prepped{"list_file_children"},
                                          pqxx::params{ownerId, parentId, withTombstoned(include)}));
    });
}

std::optional<File> PgFileStore::findChild(const std::string& ownerId, const std::optional<std::string>& parentId,
                                           const std::string& name, const Include include) const {
    return Transactions::exec("PgFileStore::findChild", [&](pqxx::work& txn) -> std::optional<File> {
        const auto res = txn.exec(pqxx::prepped{"find_file_child"},
                                  pqxx::params{ownerId, parentId, name, withTombstoned(include)});
        if (res.empty()) return std::nullopt;
        return File(res.one_row());
    });
}

void PgFileStore::insert(const File& file) {
    Transactions::exec("PgFileStore::insert", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(file.id);
        p.append(file.owner_id);
        p.append(file.parent_id);
        p.append(file.name);
        p.append(file.path);
        p.append(file.size_bytes);
        p.append(file.mime_type);
        p.append(file.content_hash);
        p.append(to_string(file.kind));
        p.append(file.is_public);
        p.append(file.share_token);
        p.append(file.current_version);
        p.append(deletedAt(file));
        p.append(file.created_at);
        p.append(file.updated_at);
        p.append(deleteBatch(file));

        txn.exec(pqxx::prepped{"insert_file"}, p);
    });
}

void PgFileStore::update(const File& file) {
    Transactions::exec("PgFileStore::update", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(file.id);
        p.append(file.owner_id);
        p.append(file.parent_id);
        p.append(file.name);
        p.append(file.path);
        p.append(file.size_bytes);
        p.append(file.mime_type);
        p.append(file.content_hash);
        p.append(to_string(file.kind));
        p.append(file.is_public);
        p.append(file.share_token);
        p.append(file.current_version);
        p.append(deletedAt(file));
        p.append(file.updated_at);
        p.append(deleteBatch(file));

        if (txn.exec(pqxx::prepped{"update_file"}, p).empty())
            throw std::runtime_error("[PgFileStore] No file with id: " + file.id);
    });
}

void PgFileStore::remove(const std::string& id) {
    Transactions::exec("PgFileStore::remove", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_file"}, pqxx::params{id});
    });
}
