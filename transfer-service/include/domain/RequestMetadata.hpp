#pragma once

#include <optional>
#include <string>

namespace transfer::domain {

/**
 * @brief Откуда пришёл запрос: адрес клиента и User-Agent
 */
struct RequestMetadata {
    std::optional<std::string> originAddress;
    std::optional<std::string> clientInfo;
};

} // namespace transfer::domain
