#pragma once

#include "application/BalanceValidator.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "domain/Money.hpp"
#include "domain/ValidationResult.hpp"
#include <memory>
#include <string>
#include <iostream>

namespace transfer::application {

/**
 * @brief Проверка перевода целиком
 *
 * Порядок фиксирован, первая ошибка прерывает проверку:
 * сумма > 0, разные счета, источник (BalanceValidator), получатель активен.
 */
class TransferValidator {
public:
    explicit TransferValidator(std::shared_ptr<BalanceValidator> balanceValidator)
        : balanceValidator_(std::move(balanceValidator))
    {
        std::cout << "[TransferValidator] Created" << std::endl;
    }

    domain::ValidationResult validate(
        ports::output::IAccountRepository& accounts,
        const std::string& sourceAccountId,
        const std::string& destinationAccountId,
        const domain::Money& amount) const
    {
        if (!amount.isPositive()) {
            return domain::ValidationResult::fail(
                domain::ErrorCode::INVALID_AMOUNT, "Amount must be greater than 0");
        }

        if (sourceAccountId == destinationAccountId) {
            return domain::ValidationResult::fail(
                domain::ErrorCode::SAME_ACCOUNT, "Cannot transfer to the same account");
        }

        auto sourceCheck = balanceValidator_->check(accounts, sourceAccountId, amount);
        if (!sourceCheck.valid) {
            return sourceCheck;
        }

        if (!accounts.findActiveById(destinationAccountId)) {
            return domain::ValidationResult::fail(
                domain::ErrorCode::ACCOUNT_NOT_FOUND, "Destination account not found or inactive");
        }

        return domain::ValidationResult::ok();
    }

private:
    std::shared_ptr<BalanceValidator> balanceValidator_;
};

} // namespace transfer::application
