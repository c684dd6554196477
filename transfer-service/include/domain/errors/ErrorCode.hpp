#pragma once

#include <string>

namespace transfer::domain {

enum class ErrorCode {
    INVALID_AMOUNT,
    SAME_ACCOUNT,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_FUNDS,
    MINIMUM_BALANCE_VIOLATION,
    TRANSFER_NOT_FOUND,
    NOT_AWAITING_APPROVAL,
    SELF_APPROVAL_FORBIDDEN,
    EXECUTION_FAILED
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::SAME_ACCOUNT: return "SAME_ACCOUNT";
        case ErrorCode::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorCode::MINIMUM_BALANCE_VIOLATION: return "MINIMUM_BALANCE_VIOLATION";
        case ErrorCode::TRANSFER_NOT_FOUND: return "TRANSFER_NOT_FOUND";
        case ErrorCode::NOT_AWAITING_APPROVAL: return "NOT_AWAITING_APPROVAL";
        case ErrorCode::SELF_APPROVAL_FORBIDDEN: return "SELF_APPROVAL_FORBIDDEN";
        case ErrorCode::EXECUTION_FAILED: return "EXECUTION_FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace transfer::domain
