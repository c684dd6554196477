#pragma once

#include "domain/Principal.hpp"
#include <string>
#include <optional>

namespace transfer::ports::output {

/**
 * @brief Клиент к провайдеру идентичности
 */
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;

    /**
     * @brief Определить пользователя по bearer-токену
     * @return Principal или nullopt если токен невалидный
     */
    virtual std::optional<domain::Principal> resolve(const std::string& token) = 0;
};

} // namespace transfer::ports::output
