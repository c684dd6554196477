#pragma once

#include "ports/output/IApprovalRepository.hpp"
#include "adapters/secondary/PostgresFields.hpp"
#include <pqxx/pqxx>
#include <stdexcept>

namespace transfer::adapters::secondary {

class PostgresApprovalRepository : public ports::output::IApprovalRepository {
public:
    explicit PostgresApprovalRepository(pqxx::work& txn) : txn_(txn) {}

    void insert(const domain::Approval& approval) override {
        txn_.exec_params(
            R"(
                INSERT INTO approvals (id, transfer_id, assigned_to, status, decision,
                                       decision_notes, decided_at, created_at, updated_at)
                VALUES ($1, $2, $3, $4, $5, $6,
                        to_timestamp($7::DOUBLE PRECISION / 1000),
                        to_timestamp($8::DOUBLE PRECISION / 1000),
                        to_timestamp($9::DOUBLE PRECISION / 1000))
            )",
            approval.id,
            approval.transferId,
            approval.assignedTo,
            domain::toString(approval.status),
            decisionText(approval),
            approval.notes,
            optionalMillis(approval.decidedAt),
            approval.createdAt.toMillis(),
            approval.updatedAt.toMillis()
        );
    }

    void update(const domain::Approval& approval) override {
        auto result = txn_.exec_params(
            R"(
                UPDATE approvals
                SET assigned_to = $2,
                    status = $3,
                    decision = $4,
                    decision_notes = $5,
                    decided_at = to_timestamp($6::DOUBLE PRECISION / 1000),
                    updated_at = to_timestamp($7::DOUBLE PRECISION / 1000)
                WHERE id = $1
            )",
            approval.id,
            approval.assignedTo,
            domain::toString(approval.status),
            decisionText(approval),
            approval.notes,
            optionalMillis(approval.decidedAt),
            approval.updatedAt.toMillis()
        );
        if (result.affected_rows() == 0) {
            throw std::runtime_error("Approval not found: " + approval.id);
        }
    }

    std::optional<domain::Approval> findByTransferId(const std::string& transferId) override {
        auto result = txn_.exec_params(
            R"(
                SELECT id, transfer_id, assigned_to, status, decision, decision_notes,
                       (EXTRACT(EPOCH FROM decided_at) * 1000)::BIGINT AS decided_at_ms,
                       (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms,
                       (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms
                FROM approvals
                WHERE transfer_id = $1
            )",
            transferId
        );
        if (result.empty()) return std::nullopt;

        const auto& row = result[0];
        domain::Approval approval;
        approval.id = row["id"].as<std::string>();
        approval.transferId = row["transfer_id"].as<std::string>();
        approval.assignedTo = optionalText(row["assigned_to"]);
        approval.status = domain::parseApprovalStatus(row["status"].as<std::string>());
        if (auto decision = optionalText(row["decision"])) {
            approval.decision = domain::parseDecision(*decision);
        }
        approval.notes = optionalText(row["decision_notes"]);
        approval.decidedAt = optionalTimestamp(row["decided_at_ms"]);
        approval.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
        approval.updatedAt = domain::Timestamp::fromMillis(row["updated_at_ms"].as<int64_t>());
        return approval;
    }

private:
    pqxx::work& txn_;

    static std::optional<std::string> decisionText(const domain::Approval& approval) {
        if (!approval.decision) return std::nullopt;
        return domain::toString(*approval.decision);
    }
};

} // namespace transfer::adapters::secondary
