#pragma once

#include "ports/output/ITransferRepository.hpp"
#include "adapters/secondary/PostgresFields.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>

namespace transfer::adapters::secondary {

/**
 * @brief Переводы в PostgreSQL, работает внутри транзакции PostgresUnitOfWork
 */
class PostgresTransferRepository : public ports::output::ITransferRepository {
public:
    explicit PostgresTransferRepository(pqxx::work& txn) : txn_(txn) {}

    void insert(const domain::Transfer& transfer) override {
        write(INSERT_TRANSFER, transfer);
    }

    void save(const domain::Transfer& transfer) override {
        write(std::string(INSERT_TRANSFER) + R"(
                ON CONFLICT (id) DO UPDATE SET
                    status = EXCLUDED.status,
                    approved_by = EXCLUDED.approved_by,
                    approved_at = EXCLUDED.approved_at,
                    error_message = EXCLUDED.error_message,
                    updated_at = EXCLUDED.updated_at,
                    completed_at = EXCLUDED.completed_at
            )", transfer);
    }

    std::optional<domain::Transfer> findById(const std::string& transferId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_TRANSFER) + " WHERE t.id = $1",
            transferId
        );
        if (result.empty()) return std::nullopt;
        return rowToTransfer(result[0]);
    }

    std::optional<domain::Transfer> lockById(const std::string& transferId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_TRANSFER) + " WHERE t.id = $1 FOR UPDATE",
            transferId
        );
        if (result.empty()) return std::nullopt;
        return rowToTransfer(result[0]);
    }

    domain::Page<domain::Transfer> find(const domain::TransferFilter& filter) override {
        domain::Page<domain::Transfer> page;

        pqxx::params countParams;
        auto where = buildWhere(filter, countParams);
        auto count = txn_.exec_params(
            "SELECT COUNT(*) AS total FROM transfers t" + where,
            countParams
        );
        page.total = count[0]["total"].as<int64_t>();

        pqxx::params params;
        where = buildWhere(filter, params);
        int next = static_cast<int>(params.size()) + 1;
        params.append(filter.limit);
        params.append(filter.offset);

        auto result = txn_.exec_params(
            std::string(SELECT_TRANSFER) + where +
                " ORDER BY t.created_at DESC, t.id" +
                " LIMIT $" + std::to_string(next) + " OFFSET $" + std::to_string(next + 1),
            params
        );
        for (const auto& row : result) {
            page.items.push_back(rowToTransfer(row));
        }
        return page;
    }

    std::vector<domain::Transfer> findAwaitingApproval(const std::string& excludingInitiator) override {
        auto result = txn_.exec_params(
            std::string(SELECT_TRANSFER) + R"(
                JOIN approvals a ON a.transfer_id = t.id
                WHERE t.status = 'AWAITING_APPROVAL'
                  AND a.status = 'PENDING'
                  AND t.initiated_by <> $1
                ORDER BY t.created_at ASC
            )",
            excludingInitiator
        );

        std::vector<domain::Transfer> transfers;
        for (const auto& row : result) {
            transfers.push_back(rowToTransfer(row));
        }
        return transfers;
    }

private:
    pqxx::work& txn_;

    static constexpr const char* INSERT_TRANSFER = R"(
        INSERT INTO transfers (
            id, source_account_id, destination_account_id, amount, status,
            initiated_by, approved_by, approved_at, requires_approval,
            description, error_message, created_at, updated_at, completed_at)
        VALUES (
            $1, $2, $3, $4::NUMERIC, $5,
            $6, $7, to_timestamp($8::DOUBLE PRECISION / 1000), $9,
            $10, $11,
            to_timestamp($12::DOUBLE PRECISION / 1000),
            to_timestamp($13::DOUBLE PRECISION / 1000),
            to_timestamp($14::DOUBLE PRECISION / 1000)))";

    static constexpr const char* SELECT_TRANSFER = R"(
        SELECT t.id, t.source_account_id, t.destination_account_id,
               t.amount::TEXT AS amount, t.status, t.initiated_by, t.approved_by,
               (EXTRACT(EPOCH FROM t.approved_at) * 1000)::BIGINT AS approved_at_ms,
               t.requires_approval, t.description, t.error_message,
               (EXTRACT(EPOCH FROM t.created_at) * 1000)::BIGINT AS created_at_ms,
               (EXTRACT(EPOCH FROM t.updated_at) * 1000)::BIGINT AS updated_at_ms,
               (EXTRACT(EPOCH FROM t.completed_at) * 1000)::BIGINT AS completed_at_ms
        FROM transfers t)";

    void write(const std::string& sql, const domain::Transfer& transfer) {
        txn_.exec_params(
            sql,
            transfer.id,
            transfer.sourceAccountId,
            transfer.destinationAccountId,
            transfer.amount.toString(),
            domain::toString(transfer.status),
            transfer.initiatedBy,
            transfer.approvedBy,
            optionalMillis(transfer.approvedAt),
            transfer.requiresApproval,
            transfer.description,
            transfer.errorMessage,
            transfer.createdAt.toMillis(),
            transfer.updatedAt.toMillis(),
            optionalMillis(transfer.completedAt)
        );
    }

    static std::string buildWhere(const domain::TransferFilter& filter, pqxx::params& params) {
        std::string where;
        auto add = [&where](const std::string& condition) {
            where += where.empty() ? " WHERE " : " AND ";
            where += condition;
        };
        auto placeholder = [&params]() {
            return "$" + std::to_string(params.size());
        };

        if (filter.accountId) {
            params.append(*filter.accountId);
            auto p = placeholder();
            add("(t.source_account_id = " + p + " OR t.destination_account_id = " + p + ")");
        }
        if (filter.initiatedBy) {
            params.append(*filter.initiatedBy);
            add("t.initiated_by = " + placeholder());
        }
        if (filter.status) {
            params.append(domain::toString(*filter.status));
            add("t.status = " + placeholder());
        }
        if (filter.from) {
            params.append(filter.from->toMillis());
            add("t.created_at >= to_timestamp(" + placeholder() + "::DOUBLE PRECISION / 1000)");
        }
        if (filter.to) {
            params.append(filter.to->toMillis());
            add("t.created_at <= to_timestamp(" + placeholder() + "::DOUBLE PRECISION / 1000)");
        }
        return where;
    }

    static domain::Transfer rowToTransfer(const pqxx::row& row) {
        domain::Transfer transfer;
        transfer.id = row["id"].as<std::string>();
        transfer.sourceAccountId = row["source_account_id"].as<std::string>();
        transfer.destinationAccountId = row["destination_account_id"].as<std::string>();
        transfer.amount = domain::Money::parse(row["amount"].as<std::string>());
        transfer.status = domain::parseTransferStatus(row["status"].as<std::string>());
        transfer.initiatedBy = row["initiated_by"].as<std::string>();
        transfer.approvedBy = optionalText(row["approved_by"]);
        transfer.approvedAt = optionalTimestamp(row["approved_at_ms"]);
        transfer.requiresApproval = row["requires_approval"].as<bool>();
        transfer.description = optionalText(row["description"]);
        transfer.errorMessage = optionalText(row["error_message"]);
        transfer.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
        transfer.updatedAt = domain::Timestamp::fromMillis(row["updated_at_ms"].as<int64_t>());
        transfer.completedAt = optionalTimestamp(row["completed_at_ms"]);
        return transfer;
    }
};

} // namespace transfer::adapters::secondary
