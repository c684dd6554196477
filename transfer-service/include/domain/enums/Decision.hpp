#pragma once

#include <string>
#include <stdexcept>

namespace transfer::domain {

/**
 * @brief Решение одобряющего по переводу
 */
enum class Decision {
    APPROVED,
    REJECTED
};

inline std::string toString(Decision decision) {
    switch (decision) {
        case Decision::APPROVED: return "APPROVED";
        case Decision::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

inline Decision parseDecision(const std::string& str) {
    if (str == "APPROVED") return Decision::APPROVED;
    if (str == "REJECTED") return Decision::REJECTED;
    throw std::invalid_argument("Decision must be APPROVED or REJECTED");
}

} // namespace transfer::domain
