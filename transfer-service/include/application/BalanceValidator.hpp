#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/Money.hpp"
#include "domain/ValidationResult.hpp"
#include <string>
#include <iostream>

namespace transfer::application {

/**
 * @brief Можно ли списать сумму со счёта
 *
 * Счёт читается с блокировкой строки, чтобы параллельные списания
 * с одного счёта шли друг за другом.
 */
class BalanceValidator {
public:
    BalanceValidator() {
        std::cout << "[BalanceValidator] Created" << std::endl;
    }

    domain::ValidationResult check(
        ports::output::IAccountRepository& accounts,
        const std::string& accountId,
        const domain::Money& amount) const
    {
        auto account = accounts.lockActiveById(accountId);
        if (!account) {
            return domain::ValidationResult::fail(
                domain::ErrorCode::ACCOUNT_NOT_FOUND, "Account not found or inactive");
        }

        auto remaining = account->balance - amount;

        if (remaining < domain::Money()) {
            return domain::ValidationResult::fail(
                domain::ErrorCode::INSUFFICIENT_FUNDS,
                "Insufficient funds. Current balance: $" + account->balance.toString());
        }

        if (remaining < account->minimumBalance) {
            return domain::ValidationResult::fail(
                domain::ErrorCode::MINIMUM_BALANCE_VIOLATION,
                "Transfer would violate minimum balance requirement of $" + account->minimumBalance.toString());
        }

        return domain::ValidationResult::ok();
    }
};

} // namespace transfer::application
