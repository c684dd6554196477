#pragma once

#include <string>

namespace transfer::domain {

enum class Role {
    CONTROLLER,
    ADMIN,
    AUDIT,
    NONE
};

inline std::string toString(Role role) {
    switch (role) {
        case Role::CONTROLLER: return "CONTROLLER";
        case Role::ADMIN: return "ADMIN";
        case Role::AUDIT: return "AUDIT";
        case Role::NONE: return "NONE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Неизвестная роль трактуется как NONE (без прав)
 */
inline Role parseRole(const std::string& str) {
    if (str == "CONTROLLER") return Role::CONTROLLER;
    if (str == "ADMIN") return Role::ADMIN;
    if (str == "AUDIT") return Role::AUDIT;
    return Role::NONE;
}

} // namespace transfer::domain
