#pragma once

#include "domain/Money.hpp"
#include "domain/Transfer.hpp"
#include "domain/RequestMetadata.hpp"
#include <string>
#include <optional>

namespace transfer::ports::input {

/**
 * @brief Запрос на создание перевода
 */
struct InitiateTransferCommand {
    std::string sourceAccountId;
    std::string destinationAccountId;
    domain::Money amount;
    std::string initiatedBy;
    std::optional<std::string> description;
    domain::RequestMetadata metadata;
};

/**
 * @brief Входной порт создания переводов
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Проверить и создать перевод
     *
     * Сумма до порога исполняется сразу, выше порога паркуется на одобрение.
     *
     * @return Перевод в статусе COMPLETED или AWAITING_APPROVAL
     * @throws domain::ValidationError перевод не прошёл проверку, ничего не записано
     * @throws domain::ExecutionError движение денег не удалось, перевод записан как FAILED
     */
    virtual domain::Transfer initiateTransfer(const InitiateTransferCommand& command) = 0;
};

} // namespace transfer::ports::input
