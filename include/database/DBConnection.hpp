#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace cf::database {

class DBConnection {
  public:
    explicit DBConnection(const std::string& connectionString);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedFiles() const;
    void initPreparedVersions() const;
    void initPreparedShares() const;
    void initPreparedQuotas() const;
};

} // namespace cf::database
