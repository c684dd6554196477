#pragma once

#include "Account.hpp"
#include "Approval.hpp"
#include "Transfer.hpp"
#include <optional>

namespace transfer::domain {

/**
 * @brief Карточка перевода: сам перевод, стороны и заявка на одобрение
 */
struct TransferDetails {
    Transfer transfer;
    std::optional<AccountSummary> sourceAccount;
    std::optional<AccountSummary> destinationAccount;
    std::optional<Approval> approval;
};

} // namespace transfer::domain
