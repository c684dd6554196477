#pragma once

#include "Timestamp.hpp"
#include "enums/TransferStatus.hpp"
#include <optional>
#include <string>

namespace transfer::domain {

/**
 * @brief Фильтр списка переводов
 *
 * accountId совпадает с любой стороной перевода.
 */
struct TransferFilter {
    std::optional<std::string> accountId;
    std::optional<std::string> initiatedBy;
    std::optional<TransferStatus> status;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    int limit = 50;
    int offset = 0;
};

} // namespace transfer::domain
