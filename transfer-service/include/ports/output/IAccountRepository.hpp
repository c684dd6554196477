#pragma once

#include "domain/Account.hpp"
#include "domain/Money.hpp"
#include <string>
#include <optional>
#include <vector>

namespace transfer::ports::output {

/**
 * @brief Репозиторий счетов в рамках транзакции
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;
    virtual std::optional<domain::Account> findActiveById(const std::string& accountId) = 0;

    /**
     * @brief Активный счёт с блокировкой строки до конца транзакции (SELECT ... FOR UPDATE)
     */
    virtual std::optional<domain::Account> lockActiveById(const std::string& accountId) = 0;

    /**
     * @brief Заблокировать строки обоих счетов перевода в порядке возрастания id
     *
     * Вызывается до любой проверки и записи, чтобы встречные переводы
     * A -> B и B -> A ждали друг друга, а не взаимоблокировались.
     * Отсутствующие счета пропускаются.
     */
    virtual void lockPair(const std::string& firstAccountId, const std::string& secondAccountId) = 0;

    /**
     * @brief Счёт с разделяемой блокировкой (SELECT ... FOR SHARE)
     *
     * Переводы по счёту не закоммитятся, пока жива транзакция читателя.
     */
    virtual std::optional<domain::Account> lockSharedById(const std::string& accountId) = 0;

    /**
     * @brief Активные счета, упорядоченные по имени
     */
    virtual std::vector<domain::Account> findAllActive() = 0;

    /**
     * @brief Списать сумму со счёта
     * @throws std::exception если счёта нет или баланс ушёл бы ниже нуля
     */
    virtual void debit(const std::string& accountId, const domain::Money& amount) = 0;

    /**
     * @brief Зачислить сумму на счёт
     * @throws std::exception если счёта нет
     */
    virtual void credit(const std::string& accountId, const domain::Money& amount) = 0;
};

} // namespace transfer::ports::output
