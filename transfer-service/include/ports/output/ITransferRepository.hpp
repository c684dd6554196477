#pragma once

#include "domain/Transfer.hpp"
#include "domain/TransferFilter.hpp"
#include "domain/Page.hpp"
#include <string>
#include <optional>
#include <vector>

namespace transfer::ports::output {

/**
 * @brief Репозиторий переводов в рамках транзакции
 */
class ITransferRepository {
public:
    virtual ~ITransferRepository() = default;

    virtual void insert(const domain::Transfer& transfer) = 0;

    /**
     * @brief Вставить или обновить изменяемые поля перевода
     */
    virtual void save(const domain::Transfer& transfer) = 0;

    virtual std::optional<domain::Transfer> findById(const std::string& transferId) = 0;

    /**
     * @brief Перевод с блокировкой строки (SELECT ... FOR UPDATE)
     */
    virtual std::optional<domain::Transfer> lockById(const std::string& transferId) = 0;

    /**
     * @brief Новые сверху
     */
    virtual domain::Page<domain::Transfer> find(const domain::TransferFilter& filter) = 0;

    /**
     * @brief AWAITING_APPROVAL с заявкой PENDING, чужие для excludingInitiator, старые сверху
     */
    virtual std::vector<domain::Transfer> findAwaitingApproval(const std::string& excludingInitiator) = 0;
};

} // namespace transfer::ports::output
