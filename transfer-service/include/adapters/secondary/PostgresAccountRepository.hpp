#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/PostgresFields.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <stdexcept>

namespace transfer::adapters::secondary {

/**
 * @brief Счета в PostgreSQL, работает внутри транзакции PostgresUnitOfWork
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Account> findById(const std::string& accountId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_ACCOUNT) + " WHERE id = $1",
            accountId
        );
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    std::optional<domain::Account> findActiveById(const std::string& accountId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_ACCOUNT) + " WHERE id = $1 AND is_active = TRUE",
            accountId
        );
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    std::optional<domain::Account> lockActiveById(const std::string& accountId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_ACCOUNT) + " WHERE id = $1 AND is_active = TRUE FOR UPDATE",
            accountId
        );
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    void lockPair(const std::string& firstAccountId, const std::string& secondAccountId) override {
        // LockRows идёт поверх Sort, поэтому строки блокируются в порядке id
        txn_.exec_params(
            "SELECT id FROM accounts WHERE id IN ($1, $2) ORDER BY id FOR UPDATE",
            firstAccountId,
            secondAccountId
        );
    }

    std::optional<domain::Account> lockSharedById(const std::string& accountId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_ACCOUNT) + " WHERE id = $1 FOR SHARE",
            accountId
        );
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    std::vector<domain::Account> findAllActive() override {
        auto result = txn_.exec(
            std::string(SELECT_ACCOUNT) + " WHERE is_active = TRUE ORDER BY account_name"
        );

        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(rowToAccount(row));
        }
        return accounts;
    }

    void debit(const std::string& accountId, const domain::Money& amount) override {
        // CHECK (balance >= 0) отклонит уход в минус
        auto result = txn_.exec_params(
            R"(
                UPDATE accounts
                SET balance = balance - $1::NUMERIC, updated_at = NOW()
                WHERE id = $2
                RETURNING id
            )",
            amount.toString(),
            accountId
        );
        if (result.affected_rows() == 0) {
            throw std::runtime_error("Account not found: " + accountId);
        }
    }

    void credit(const std::string& accountId, const domain::Money& amount) override {
        auto result = txn_.exec_params(
            R"(
                UPDATE accounts
                SET balance = balance + $1::NUMERIC, updated_at = NOW()
                WHERE id = $2
                RETURNING id
            )",
            amount.toString(),
            accountId
        );
        if (result.affected_rows() == 0) {
            throw std::runtime_error("Account not found: " + accountId);
        }
    }

private:
    pqxx::work& txn_;

    static constexpr const char* SELECT_ACCOUNT = R"(
        SELECT id, account_number, account_name,
               balance::TEXT AS balance,
               minimum_balance::TEXT AS minimum_balance,
               is_active,
               (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms,
               (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms
        FROM accounts)";

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.accountNumber = row["account_number"].as<std::string>();
        account.name = row["account_name"].as<std::string>();
        account.balance = domain::Money::parse(row["balance"].as<std::string>());
        account.minimumBalance = domain::Money::parse(row["minimum_balance"].as<std::string>());
        account.active = row["is_active"].as<bool>();
        account.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
        account.updatedAt = domain::Timestamp::fromMillis(row["updated_at_ms"].as<int64_t>());
        return account;
    }
};

} // namespace transfer::adapters::secondary
