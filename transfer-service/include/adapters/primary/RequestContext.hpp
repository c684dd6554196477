#pragma once

#include <IRequest.hpp>
#include "domain/Principal.hpp"
#include "domain/RequestMetadata.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @file RequestContext.hpp
 * @brief Данные запроса, общие для всех обработчиков API
 */

namespace transfer::adapters::primary
{

    inline constexpr const char *PRINCIPAL_ID_ATTRIBUTE = "principalId";
    inline constexpr const char *PRINCIPAL_ROLE_ATTRIBUTE = "principalRole";

    /**
     * @brief Пользователь, которого положил в атрибуты PrincipalExtractorMiddleware
     */
    inline std::optional<domain::Principal> principalFrom(IRequest &req)
    {
        auto id = req.getAttribute(PRINCIPAL_ID_ATTRIBUTE);
        if (!id || id->empty())
        {
            return std::nullopt;
        }
        domain::Principal principal;
        principal.id = *id;
        principal.role = domain::parseRole(req.getAttribute(PRINCIPAL_ROLE_ATTRIBUTE).value_or("NONE"));
        return principal;
    }

    /**
     * @brief Адрес клиента: X-Forwarded-For (первый), X-Real-IP, адрес соединения
     */
    inline domain::RequestMetadata metadataFrom(IRequest &req)
    {
        domain::RequestMetadata metadata;

        auto forwarded = req.getHeader("X-Forwarded-For").value_or("");
        if (!forwarded.empty())
        {
            auto first = forwarded.substr(0, forwarded.find(','));
            first.erase(0, first.find_first_not_of(' '));
            first.erase(first.find_last_not_of(' ') + 1);
            metadata.originAddress = first;
        }
        else if (auto realIp = req.getHeader("X-Real-IP"); realIp && !realIp->empty())
        {
            metadata.originAddress = *realIp;
        }
        else if (auto ip = req.getIp(); !ip.empty())
        {
            metadata.originAddress = ip;
        }

        if (auto userAgent = req.getHeader("User-Agent"); userAgent && !userAgent->empty())
        {
            metadata.clientInfo = *userAgent;
        }
        return metadata;
    }

    /**
     * @brief Целый параметр query string в диапазоне [min, max]
     * @throws std::invalid_argument с текстом для ответа 400
     */
    inline int queryInt(IRequest &req, const std::string &name, int defaultValue, int min, int max)
    {
        auto raw = req.getQueryParam(name);
        if (!raw || raw->empty())
        {
            return defaultValue;
        }

        int value = 0;
        try
        {
            size_t pos = 0;
            value = std::stoi(*raw, &pos);
            if (pos != raw->size())
            {
                throw std::invalid_argument(name);
            }
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid " + name + ": " + *raw);
        }

        if (value < min || value > max)
        {
            throw std::invalid_argument(
                name + " must be between " + std::to_string(min) + " and " + std::to_string(max));
        }
        return value;
    }

    /**
     * @throws std::invalid_argument если дата не в формате ISO 8601
     */
    inline std::optional<domain::Timestamp> queryTimestamp(IRequest &req, const std::string &name)
    {
        auto raw = req.getQueryParam(name);
        if (!raw || raw->empty())
        {
            return std::nullopt;
        }
        return domain::Timestamp::fromString(*raw);
    }

    inline std::optional<std::string> queryText(IRequest &req, const std::string &name)
    {
        auto raw = req.getQueryParam(name);
        if (!raw || raw->empty())
        {
            return std::nullopt;
        }
        return raw;
    }

} // namespace transfer::adapters::primary
