#pragma once

#include "AuditDetail.hpp"
#include "Timestamp.hpp"
#include "enums/AuditAction.hpp"
#include <optional>
#include <string>

namespace transfer::domain {

/**
 * @brief Неизменяемая запись журнала аудита
 */
struct AuditRecord {
    std::string id;
    AuditAction action = AuditAction::TRANSFER_INITIATED;
    std::optional<std::string> actorId;
    std::optional<std::string> transferId;
    std::optional<std::string> accountId;
    AuditDetail detail;
    std::optional<std::string> originAddress;
    std::optional<std::string> clientInfo;
    Timestamp createdAt;
};

} // namespace transfer::domain
