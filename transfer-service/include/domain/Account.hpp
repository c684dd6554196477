#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>

namespace transfer::domain {

/**
 * @brief Счёт, между которыми двигаются деньги
 *
 * Баланс никогда не уходит ниже нуля, после списания не ниже minimumBalance.
 */
class Account {
public:
    std::string id;
    std::string accountNumber;
    std::string name;
    Money balance;
    Money minimumBalance;
    bool active = true;
    Timestamp createdAt;
    Timestamp updatedAt;

    Account() = default;

    Account(const std::string& id_, const std::string& number, const std::string& name_,
            const Money& balance_, const Money& minimum = Money())
        : id(id_)
        , accountNumber(number)
        , name(name_)
        , balance(balance_)
        , minimumBalance(minimum)
        , active(true)
        , createdAt(Timestamp::now())
        , updatedAt(Timestamp::now())
    {}
};

/**
 * @brief Краткие сведения о счёте для карточки перевода
 */
struct AccountSummary {
    std::string id;
    std::string accountNumber;
    std::string name;
};

} // namespace transfer::domain
