#pragma once

#include "Account.hpp"
#include "Page.hpp"
#include "Transfer.hpp"

namespace transfer::domain {

/**
 * @brief Карточка счёта: счёт и страница его переводов из одной транзакции
 */
struct AccountDetails {
    Account account;
    Page<Transfer> history;
};

} // namespace transfer::domain
