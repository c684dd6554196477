#pragma once

#include <string>
#include <stdexcept>

namespace transfer::domain {

enum class AuditAction {
    USER_LOGIN,
    USER_LOGOUT,
    TRANSFER_INITIATED,
    TRANSFER_VALIDATED,
    TRANSFER_AWAITING_APPROVAL,
    TRANSFER_APPROVED,
    TRANSFER_REJECTED,
    TRANSFER_COMPLETED,
    TRANSFER_FAILED,
    BALANCE_CHECKED,
    USER_ROLE_CHANGED,
    ACCOUNT_VIEWED,
    AUDIT_LOG_VIEWED
};

inline std::string toString(AuditAction action) {
    switch (action) {
        case AuditAction::USER_LOGIN: return "USER_LOGIN";
        case AuditAction::USER_LOGOUT: return "USER_LOGOUT";
        case AuditAction::TRANSFER_INITIATED: return "TRANSFER_INITIATED";
        case AuditAction::TRANSFER_VALIDATED: return "TRANSFER_VALIDATED";
        case AuditAction::TRANSFER_AWAITING_APPROVAL: return "TRANSFER_AWAITING_APPROVAL";
        case AuditAction::TRANSFER_APPROVED: return "TRANSFER_APPROVED";
        case AuditAction::TRANSFER_REJECTED: return "TRANSFER_REJECTED";
        case AuditAction::TRANSFER_COMPLETED: return "TRANSFER_COMPLETED";
        case AuditAction::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case AuditAction::BALANCE_CHECKED: return "BALANCE_CHECKED";
        case AuditAction::USER_ROLE_CHANGED: return "USER_ROLE_CHANGED";
        case AuditAction::ACCOUNT_VIEWED: return "ACCOUNT_VIEWED";
        case AuditAction::AUDIT_LOG_VIEWED: return "AUDIT_LOG_VIEWED";
        default: return "UNKNOWN";
    }
}

inline AuditAction parseAuditAction(const std::string& str) {
    if (str == "USER_LOGIN") return AuditAction::USER_LOGIN;
    if (str == "USER_LOGOUT") return AuditAction::USER_LOGOUT;
    if (str == "TRANSFER_INITIATED") return AuditAction::TRANSFER_INITIATED;
    if (str == "TRANSFER_VALIDATED") return AuditAction::TRANSFER_VALIDATED;
    if (str == "TRANSFER_AWAITING_APPROVAL") return AuditAction::TRANSFER_AWAITING_APPROVAL;
    if (str == "TRANSFER_APPROVED") return AuditAction::TRANSFER_APPROVED;
    if (str == "TRANSFER_REJECTED") return AuditAction::TRANSFER_REJECTED;
    if (str == "TRANSFER_COMPLETED") return AuditAction::TRANSFER_COMPLETED;
    if (str == "TRANSFER_FAILED") return AuditAction::TRANSFER_FAILED;
    if (str == "BALANCE_CHECKED") return AuditAction::BALANCE_CHECKED;
    if (str == "USER_ROLE_CHANGED") return AuditAction::USER_ROLE_CHANGED;
    if (str == "ACCOUNT_VIEWED") return AuditAction::ACCOUNT_VIEWED;
    if (str == "AUDIT_LOG_VIEWED") return AuditAction::AUDIT_LOG_VIEWED;
    throw std::invalid_argument("Unknown audit action: " + str);
}

} // namespace transfer::domain
