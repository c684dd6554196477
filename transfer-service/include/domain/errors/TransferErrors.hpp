#pragma once

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>

/**
 * @file TransferErrors.hpp
 * @brief Иерархия исключений движка переводов
 */

namespace transfer::domain {

/**
 * @brief Категория ошибки
 *
 * VALIDATION - перевод отклонён до записи в хранилище.
 * WORKFLOW   - операция не применима к текущему состоянию перевода.
 * EXECUTION  - сбой движения денег, перевод помечен FAILED.
 */
enum class ErrorCategory {
    VALIDATION,
    WORKFLOW,
    EXECUTION
};

/**
 * @brief Базовое исключение бизнес-операций над переводами
 */
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCategory category, ErrorCode code, const std::string& message)
        : std::runtime_error(message), category_(category), code_(code) {}

    ErrorCategory category() const { return category_; }
    ErrorCode code() const { return code_; }

private:
    ErrorCategory category_;
    ErrorCode code_;
};

class ValidationError : public TransferError {
public:
    ValidationError(ErrorCode code, const std::string& message)
        : TransferError(ErrorCategory::VALIDATION, code, message) {}
};

class WorkflowError : public TransferError {
public:
    WorkflowError(ErrorCode code, const std::string& message)
        : TransferError(ErrorCategory::WORKFLOW, code, message) {}
};

/**
 * @brief Сбой исполнения: все изменения попытки откатены
 */
class ExecutionError : public TransferError {
public:
    ExecutionError(const std::string& transferId, const std::string& message)
        : TransferError(ErrorCategory::EXECUTION, ErrorCode::EXECUTION_FAILED, message)
        , transferId_(transferId) {}

    const std::string& transferId() const { return transferId_; }

private:
    std::string transferId_;
};

} // namespace transfer::domain
