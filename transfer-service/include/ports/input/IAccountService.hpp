#pragma once

#include "domain/Account.hpp"
#include "domain/AccountDetails.hpp"
#include "domain/Transfer.hpp"
#include "domain/RequestMetadata.hpp"
#include "domain/Page.hpp"
#include <string>
#include <optional>
#include <vector>

namespace transfer::ports::input {

class IAccountService {
public:
    virtual ~IAccountService() = default;

    virtual std::vector<domain::Account> listAccounts() = 0;

    /**
     * @brief Счёт по ID; если передан viewerId, просмотр пишется как ACCOUNT_VIEWED
     */
    virtual std::optional<domain::Account> getAccount(
        const std::string& accountId,
        const std::optional<std::string>& viewerId,
        const domain::RequestMetadata& metadata) = 0;

    /**
     * @brief Переводы, затрагивающие счёт, новые сверху
     */
    virtual domain::Page<domain::Transfer> getAccountHistory(
        const std::string& accountId, int limit, int offset) = 0;

    /**
     * @brief Счёт вместе с историей, прочитанные в одной транзакции
     *
     * Баланс и список переводов согласованы между собой. Просмотр пишется
     * как ACCOUNT_VIEWED от viewerId.
     */
    virtual std::optional<domain::AccountDetails> getAccountDetails(
        const std::string& accountId,
        const std::string& viewerId,
        int limit,
        int offset,
        const domain::RequestMetadata& metadata) = 0;
};

} // namespace transfer::ports::input
