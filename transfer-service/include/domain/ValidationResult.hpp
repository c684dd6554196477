#pragma once

#include "errors/ErrorCode.hpp"
#include <string>

namespace transfer::domain {

/**
 * @brief Результат проверки перевода
 */
struct ValidationResult {
    bool valid = true;
    ErrorCode code = ErrorCode::INVALID_AMOUNT;
    std::string message;

    static ValidationResult ok() {
        return ValidationResult{};
    }

    static ValidationResult fail(ErrorCode code, const std::string& message) {
        return ValidationResult{false, code, message};
    }
};

} // namespace transfer::domain
