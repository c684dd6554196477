#pragma once

#include "domain/Timestamp.hpp"
#include <pqxx/pqxx>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @file PostgresFields.hpp
 * @brief Преобразование nullable-колонок и времени для репозиториев PostgreSQL
 *
 * Время передаётся в запросы миллисекундами epoch:
 * запись  - to_timestamp($n::DOUBLE PRECISION / 1000)
 * чтение  - (EXTRACT(EPOCH FROM col) * 1000)::BIGINT
 */

namespace transfer::adapters::secondary {

inline std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

inline std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return domain::Timestamp::fromMillis(field.as<int64_t>());
}

inline std::optional<int64_t> optionalMillis(const std::optional<domain::Timestamp>& timestamp) {
    if (!timestamp) {
        return std::nullopt;
    }
    return timestamp->toMillis();
}

} // namespace transfer::adapters::secondary
