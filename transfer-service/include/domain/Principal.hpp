#pragma once

#include "enums/Role.hpp"
#include <string>

namespace transfer::domain {

/**
 * @brief Аутентифицированный пользователь, которого вернул провайдер идентичности
 */
struct Principal {
    std::string id;
    Role role = Role::NONE;
};

} // namespace transfer::domain
