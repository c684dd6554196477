#pragma once

#include "IUnitOfWork.hpp"
#include <memory>

namespace transfer::ports::output {

/**
 * @brief Хранилище счетов, переводов, заявок и аудита
 */
class ITransferStore {
public:
    virtual ~ITransferStore() = default;

    /**
     * @brief Начать транзакцию (READ COMMITTED)
     */
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;

    /**
     * @brief Проверка доступности для /health
     */
    virtual bool ping() = 0;
};

} // namespace transfer::ports::output
