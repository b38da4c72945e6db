#pragma once

#include "DBPool.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <utility>

namespace cf::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg) {
        dbPool_ = std::make_shared<DBPool>(static_cast<size_t>(cfg.pool_size), cfg.connectionString());
    }

    static void init(const std::string& connectionString, const size_t poolSize = 4) {
        dbPool_ = std::make_shared<DBPool>(poolSize, connectionString);
    }

    static void shutdown() { dbPool_.reset(); }

    [[nodiscard]] static bool isInitialized() { return static_cast<bool>(dbPool_); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            pqxx::work txn(conn->get());
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                              ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
            // Compiler satisfaction token
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

} // namespace cf::database
