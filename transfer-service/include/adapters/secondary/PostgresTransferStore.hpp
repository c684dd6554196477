#pragma once

#include "ports/output/ITransferStore.hpp"
#include "adapters/secondary/PostgresUnitOfWork.hpp"
#include "adapters/secondary/SchemaSql.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace transfer::adapters::secondary {

/**
 * @brief Хранилище в PostgreSQL
 *
 * Каждая транзакция открывает своё соединение, поэтому потоки HTTP-сервера
 * не делят соединения между собой. Схема создаётся при старте (идемпотентно)
 * из sql/schema.sql, который CMake встраивает в SchemaSql.hpp.
 */
class PostgresTransferStore : public ports::output::ITransferStore {
public:
    explicit PostgresTransferStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTransferStore] Connecting to " << settings_->getHost()
                  << ":" << settings_->getPort() << "/" << settings_->getName() << std::endl;
        initSchema();
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<PostgresUnitOfWork>(settings_->getConnectionString());
    }

    bool ping() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::nontransaction txn(conn);
            txn.exec("SELECT 1");
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferStore] ping failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(SCHEMA_SQL);

            txn.commit();
            std::cout << "[PostgresTransferStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace transfer::adapters::secondary
