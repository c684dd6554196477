#pragma once

#include "Timestamp.hpp"
#include "enums/ApprovalStatus.hpp"
#include "enums/Decision.hpp"
#include <optional>
#include <string>

namespace transfer::domain {

/**
 * @brief Заявка на одобрение крупного перевода (1:1 с Transfer)
 */
class Approval {
public:
    std::string id;
    std::string transferId;
    std::optional<std::string> assignedTo;
    ApprovalStatus status = ApprovalStatus::PENDING;
    std::optional<Decision> decision;
    std::optional<std::string> notes;
    std::optional<Timestamp> decidedAt;
    Timestamp createdAt;
    Timestamp updatedAt;

    Approval() = default;

    Approval(const std::string& id_, const std::string& transferId_)
        : id(id_)
        , transferId(transferId_)
        , status(ApprovalStatus::PENDING)
        , createdAt(Timestamp::now())
        , updatedAt(createdAt)
    {}

    void decide(const std::string& approverId, Decision value, const std::optional<std::string>& decisionNotes) {
        assignedTo = approverId;
        decision = value;
        status = value == Decision::APPROVED ? ApprovalStatus::APPROVED : ApprovalStatus::REJECTED;
        notes = decisionNotes;
        decidedAt = Timestamp::now();
        updatedAt = *decidedAt;
    }
};

} // namespace transfer::domain
