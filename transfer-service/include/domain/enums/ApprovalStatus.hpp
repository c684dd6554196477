#pragma once

#include <string>
#include <stdexcept>

namespace transfer::domain {

enum class ApprovalStatus {
    PENDING,
    APPROVED,
    REJECTED
};

inline std::string toString(ApprovalStatus status) {
    switch (status) {
        case ApprovalStatus::PENDING: return "PENDING";
        case ApprovalStatus::APPROVED: return "APPROVED";
        case ApprovalStatus::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

inline ApprovalStatus parseApprovalStatus(const std::string& str) {
    if (str == "PENDING") return ApprovalStatus::PENDING;
    if (str == "APPROVED") return ApprovalStatus::APPROVED;
    if (str == "REJECTED") return ApprovalStatus::REJECTED;
    throw std::invalid_argument("Unknown approval status: " + str);
}

} // namespace transfer::domain
