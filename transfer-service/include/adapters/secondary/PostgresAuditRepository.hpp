#pragma once

#include "ports/output/IAuditRepository.hpp"
#include "adapters/secondary/PostgresFields.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <string>

namespace transfer::adapters::secondary {

/**
 * @brief Журнал аудита в PostgreSQL
 *
 * Порядок записей внутри одной миллисекунды держит колонка seq (BIGSERIAL).
 */
class PostgresAuditRepository : public ports::output::IAuditRepository {
public:
    explicit PostgresAuditRepository(pqxx::work& txn) : txn_(txn) {}

    void append(const domain::AuditRecord& record) override {
        txn_.exec_params(
            R"(
                INSERT INTO audit_records (id, action, actor_id, transfer_id, account_id,
                                           details, origin_address, client_info, created_at)
                VALUES ($1, $2, $3, $4, $5, $6::JSONB, $7, $8,
                        to_timestamp($9::DOUBLE PRECISION / 1000))
            )",
            record.id,
            domain::toString(record.action),
            record.actorId,
            record.transferId,
            record.accountId,
            record.detail.toJson().dump(),
            record.originAddress,
            record.clientInfo,
            record.createdAt.toMillis()
        );
    }

    domain::Page<domain::AuditRecord> find(const domain::AuditRecordFilter& filter) override {
        domain::Page<domain::AuditRecord> page;

        pqxx::params countParams;
        auto where = buildWhere(filter, countParams);
        auto count = txn_.exec_params(
            "SELECT COUNT(*) AS total FROM audit_records" + where,
            countParams
        );
        page.total = count[0]["total"].as<int64_t>();

        pqxx::params params;
        where = buildWhere(filter, params);
        int next = static_cast<int>(params.size()) + 1;
        params.append(filter.limit);
        params.append(filter.offset);

        auto result = txn_.exec_params(
            std::string(SELECT_RECORD) + where +
                " ORDER BY created_at DESC, seq DESC" +
                " LIMIT $" + std::to_string(next) + " OFFSET $" + std::to_string(next + 1),
            params
        );
        for (const auto& row : result) {
            page.items.push_back(rowToRecord(row));
        }
        return page;
    }

    std::vector<domain::AuditRecord> findByTransferId(const std::string& transferId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_RECORD) + " WHERE transfer_id = $1 ORDER BY created_at ASC, seq ASC",
            transferId
        );

        std::vector<domain::AuditRecord> records;
        for (const auto& row : result) {
            records.push_back(rowToRecord(row));
        }
        return records;
    }

private:
    pqxx::work& txn_;

    static constexpr const char* SELECT_RECORD = R"(
        SELECT id, action, actor_id, transfer_id, account_id,
               details::TEXT AS details, origin_address, client_info,
               (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms
        FROM audit_records)";

    static std::string buildWhere(const domain::AuditRecordFilter& filter, pqxx::params& params) {
        std::string where;
        auto add = [&where](const std::string& condition) {
            where += where.empty() ? " WHERE " : " AND ";
            where += condition;
        };
        auto placeholder = [&params]() {
            return "$" + std::to_string(params.size());
        };

        if (filter.actorId) {
            params.append(*filter.actorId);
            add("actor_id = " + placeholder());
        }
        if (filter.transferId) {
            params.append(*filter.transferId);
            add("transfer_id = " + placeholder());
        }
        if (filter.accountId) {
            params.append(*filter.accountId);
            add("account_id = " + placeholder());
        }
        if (!filter.actions.empty()) {
            std::string list;
            for (auto action : filter.actions) {
                params.append(domain::toString(action));
                list += (list.empty() ? "" : ", ") + placeholder();
            }
            add("action IN (" + list + ")");
        }
        if (filter.from) {
            params.append(filter.from->toMillis());
            add("created_at >= to_timestamp(" + placeholder() + "::DOUBLE PRECISION / 1000)");
        }
        if (filter.to) {
            params.append(filter.to->toMillis());
            add("created_at <= to_timestamp(" + placeholder() + "::DOUBLE PRECISION / 1000)");
        }
        return where;
    }

    static domain::AuditRecord rowToRecord(const pqxx::row& row) {
        domain::AuditRecord record;
        record.id = row["id"].as<std::string>();
        record.action = domain::parseAuditAction(row["action"].as<std::string>());
        record.actorId = optionalText(row["actor_id"]);
        record.transferId = optionalText(row["transfer_id"]);
        record.accountId = optionalText(row["account_id"]);
        record.detail = domain::AuditDetail::fromJson(nlohmann::json::parse(row["details"].as<std::string>()));
        record.originAddress = optionalText(row["origin_address"]);
        record.clientInfo = optionalText(row["client_info"]);
        record.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
        return record;
    }
};

} // namespace transfer::adapters::secondary
