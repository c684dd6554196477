#pragma once

#include <string>
#include <stdexcept>

namespace transfer::domain {

enum class TransferStatus {
    PENDING,
    AWAITING_APPROVAL,
    APPROVED,
    REJECTED,
    COMPLETED,
    FAILED
};

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "PENDING";
        case TransferStatus::AWAITING_APPROVAL: return "AWAITING_APPROVAL";
        case TransferStatus::APPROVED: return "APPROVED";
        case TransferStatus::REJECTED: return "REJECTED";
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline TransferStatus parseTransferStatus(const std::string& str) {
    if (str == "PENDING") return TransferStatus::PENDING;
    if (str == "AWAITING_APPROVAL") return TransferStatus::AWAITING_APPROVAL;
    if (str == "APPROVED") return TransferStatus::APPROVED;
    if (str == "REJECTED") return TransferStatus::REJECTED;
    if (str == "COMPLETED") return TransferStatus::COMPLETED;
    if (str == "FAILED") return TransferStatus::FAILED;
    throw std::invalid_argument("Unknown transfer status: " + str);
}

} // namespace transfer::domain
