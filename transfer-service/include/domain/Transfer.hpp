// transfer-service/include/domain/Transfer.hpp
#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/TransferStatus.hpp"
#include <optional>
#include <string>

namespace transfer::domain {

/**
 * @brief Перевод между двумя счетами
 *
 * PENDING -> COMPLETED | FAILED
 * AWAITING_APPROVAL -> APPROVED -> COMPLETED | FAILED
 * AWAITING_APPROVAL -> REJECTED
 */
class Transfer {
public:
    std::string id;
    std::string sourceAccountId;
    std::string destinationAccountId;
    Money amount;
    TransferStatus status = TransferStatus::PENDING;
    std::string initiatedBy;
    std::optional<std::string> approvedBy;
    std::optional<Timestamp> approvedAt;
    bool requiresApproval = false;
    std::optional<std::string> description;
    std::optional<std::string> errorMessage;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> completedAt;

    Transfer() = default;

    Transfer(const std::string& id_, const std::string& source, const std::string& destination,
             const Money& amount_, const std::string& initiator)
        : id(id_)
        , sourceAccountId(source)
        , destinationAccountId(destination)
        , amount(amount_)
        , status(TransferStatus::PENDING)
        , initiatedBy(initiator)
        , createdAt(Timestamp::now())
        , updatedAt(createdAt)
    {}

    /**
     * @brief Перевод выше порога уходит на одобрение
     */
    void routeForApproval() {
        requiresApproval = true;
        status = TransferStatus::AWAITING_APPROVAL;
        updatedAt = Timestamp::now();
    }

    void approve(const std::string& approverId) {
        status = TransferStatus::APPROVED;
        approvedBy = approverId;
        approvedAt = Timestamp::now();
        updatedAt = *approvedAt;
    }

    /**
     * @brief Отклонивший тоже пишется в approvedBy
     */
    void reject(const std::string& approverId) {
        status = TransferStatus::REJECTED;
        approvedBy = approverId;
        approvedAt = Timestamp::now();
        updatedAt = *approvedAt;
    }

    void complete() {
        status = TransferStatus::COMPLETED;
        completedAt = Timestamp::now();
        updatedAt = *completedAt;
    }

    void fail(const std::string& error) {
        status = TransferStatus::FAILED;
        errorMessage = error;
        updatedAt = Timestamp::now();
    }

    bool touches(const std::string& accountId) const {
        return sourceAccountId == accountId || destinationAccountId == accountId;
    }
};

} // namespace transfer::domain
