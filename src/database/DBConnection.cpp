#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"

using namespace cf::logging;

namespace cf::database {

DBConnection::DBConnection(const std::string& connectionString)
    : conn_(std::make_unique<pqxx::connection>(connectionString)) {
    LogRegistry::db()->debug("[DBConnection] Connected to {}", conn_->dbname());
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedFiles();
    initPreparedVersions();
    initPreparedShares();
    initPreparedQuotas();
}

} // namespace cf::database
