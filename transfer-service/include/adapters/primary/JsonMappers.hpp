#pragma once

#include "domain/Account.hpp"
#include "domain/Approval.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/Transfer.hpp"
#include "domain/TransferDetails.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * @file JsonMappers.hpp
 * @brief JSON-представление доменных объектов в ответах API
 *
 * Суммы отдаются десятичными строками ("1500000.00"), время в ISO 8601 UTC.
 */

namespace transfer::adapters::primary
{

    inline nlohmann::json optionalToJson(const std::optional<std::string> &value)
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    inline nlohmann::json optionalToJson(const std::optional<domain::Timestamp> &value)
    {
        return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
    }

    inline nlohmann::json transferToJson(const domain::Transfer &transfer)
    {
        nlohmann::json j;
        j["id"] = transfer.id;
        j["source_account_id"] = transfer.sourceAccountId;
        j["destination_account_id"] = transfer.destinationAccountId;
        j["amount"] = transfer.amount.toString();
        j["status"] = domain::toString(transfer.status);
        j["initiated_by"] = transfer.initiatedBy;
        j["approved_by"] = optionalToJson(transfer.approvedBy);
        j["approved_at"] = optionalToJson(transfer.approvedAt);
        j["requires_approval"] = transfer.requiresApproval;
        j["description"] = optionalToJson(transfer.description);
        j["error_message"] = optionalToJson(transfer.errorMessage);
        j["created_at"] = transfer.createdAt.toString();
        j["updated_at"] = transfer.updatedAt.toString();
        j["completed_at"] = optionalToJson(transfer.completedAt);
        return j;
    }

    inline nlohmann::json accountToJson(const domain::Account &account)
    {
        nlohmann::json j;
        j["id"] = account.id;
        j["account_number"] = account.accountNumber;
        j["account_name"] = account.name;
        j["balance"] = account.balance.toString();
        j["minimum_balance"] = account.minimumBalance.toString();
        j["is_active"] = account.active;
        j["created_at"] = account.createdAt.toString();
        j["updated_at"] = account.updatedAt.toString();
        return j;
    }

    inline nlohmann::json accountSummaryToJson(const std::optional<domain::AccountSummary> &summary)
    {
        if (!summary)
        {
            return nullptr;
        }
        return {
            {"id", summary->id},
            {"account_number", summary->accountNumber},
            {"account_name", summary->name}};
    }

    inline nlohmann::json approvalToJson(const domain::Approval &approval)
    {
        nlohmann::json j;
        j["id"] = approval.id;
        j["transfer_id"] = approval.transferId;
        j["assigned_to"] = optionalToJson(approval.assignedTo);
        j["status"] = domain::toString(approval.status);
        j["decision"] = approval.decision ? nlohmann::json(domain::toString(*approval.decision)) : nlohmann::json(nullptr);
        j["notes"] = optionalToJson(approval.notes);
        j["decided_at"] = optionalToJson(approval.decidedAt);
        j["created_at"] = approval.createdAt.toString();
        return j;
    }

    inline nlohmann::json auditRecordToJson(const domain::AuditRecord &record)
    {
        nlohmann::json j;
        j["id"] = record.id;
        j["action"] = domain::toString(record.action);
        j["user_id"] = optionalToJson(record.actorId);
        j["transfer_id"] = optionalToJson(record.transferId);
        j["account_id"] = optionalToJson(record.accountId);
        j["details"] = record.detail.toJson();
        j["ip_address"] = optionalToJson(record.originAddress);
        j["user_agent"] = optionalToJson(record.clientInfo);
        j["created_at"] = record.createdAt.toString();
        return j;
    }

    inline nlohmann::json transferDetailsToJson(const domain::TransferDetails &details)
    {
        nlohmann::json j;
        j["transfer"] = transferToJson(details.transfer);
        j["source_account"] = accountSummaryToJson(details.sourceAccount);
        j["destination_account"] = accountSummaryToJson(details.destinationAccount);
        j["approval"] = details.approval ? approvalToJson(*details.approval) : nlohmann::json(nullptr);
        return j;
    }

    /**
     * @brief HTTP-статус бизнес-ошибки
     */
    inline int httpStatusFor(const domain::TransferError &error)
    {
        switch (error.code())
        {
        case domain::ErrorCode::TRANSFER_NOT_FOUND:
            return 404;
        case domain::ErrorCode::NOT_AWAITING_APPROVAL:
            return 409;
        case domain::ErrorCode::SELF_APPROVAL_FORBIDDEN:
            return 403;
        case domain::ErrorCode::EXECUTION_FAILED:
            return 422;
        default:
            return 400;
        }
    }

    inline nlohmann::json transferErrorToJson(const domain::TransferError &error)
    {
        nlohmann::json j;
        j["error"] = error.what();
        j["code"] = domain::toString(error.code());
        if (auto execution = dynamic_cast<const domain::ExecutionError *>(&error))
        {
            j["transfer_id"] = execution->transferId();
            j["status"] = domain::toString(domain::TransferStatus::FAILED);
        }
        return j;
    }

} // namespace transfer::adapters::primary
