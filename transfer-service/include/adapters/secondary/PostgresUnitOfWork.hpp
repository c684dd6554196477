#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresTransferRepository.hpp"
#include "adapters/secondary/PostgresApprovalRepository.hpp"
#include "adapters/secondary/PostgresAuditRepository.hpp"
#include <pqxx/pqxx>
#include <string>

namespace transfer::adapters::secondary {

/**
 * @brief Одно соединение и одна транзакция (READ COMMITTED) на запрос
 *
 * pqxx::work откатывается в деструкторе, если commit() не был вызван.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const std::string& connectionString)
        : connection_(connectionString)
        , txn_(connection_)
        , accounts_(txn_)
        , transfers_(txn_)
        , approvals_(txn_)
        , auditRecords_(txn_)
    {}

    ports::output::IAccountRepository& accounts() override { return accounts_; }
    ports::output::ITransferRepository& transfers() override { return transfers_; }
    ports::output::IApprovalRepository& approvals() override { return approvals_; }
    ports::output::IAuditRepository& auditRecords() override { return auditRecords_; }

    void commit() override {
        txn_.commit();
    }

private:
    pqxx::connection connection_;
    pqxx::work txn_;
    PostgresAccountRepository accounts_;
    PostgresTransferRepository transfers_;
    PostgresApprovalRepository approvals_;
    PostgresAuditRepository auditRecords_;
};

} // namespace transfer::adapters::secondary
