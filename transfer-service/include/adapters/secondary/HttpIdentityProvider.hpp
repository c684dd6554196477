#pragma once

#include "ports/output/IIdentityProvider.hpp"
#include "settings/IdentityProviderSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::secondary {

/**
 * @brief HTTP клиент к сервису идентичности
 *
 * Вызывает POST /api/v1/auth/validate и ожидает
 * {"valid": bool, "user_id": "...", "role": "ADMIN|CONTROLLER|AUDIT|NONE"}.
 */
class HttpIdentityProvider : public ports::output::IIdentityProvider {
public:
    HttpIdentityProvider(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IdentityProviderSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpIdentityProvider] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    std::optional<domain::Principal> resolve(const std::string& token) override {
        if (token.empty()) {
            return std::nullopt;
        }

        try {
            nlohmann::json requestBody = {{"token", token}};

            SimpleRequest request(
                "POST",
                "/api/v1/auth/validate",
                requestBody.dump(),
                settings_->getHost(),
                settings_->getPort(),
                {{"Content-Type", "application/json"}}
            );

            SimpleResponse response;
            if (!httpClient_->send(request, response)) {
                std::cerr << "[HttpIdentityProvider] Auth service unreachable" << std::endl;
                return std::nullopt;
            }

            if (response.getStatus() != 200) {
                std::cout << "[HttpIdentityProvider] Auth service returned " << response.getStatus() << std::endl;
                return std::nullopt;
            }

            auto responseBody = nlohmann::json::parse(response.getBody());
            if (!responseBody.value("valid", false)) {
                return std::nullopt;
            }

            domain::Principal principal;
            principal.id = responseBody.value("user_id", "");
            principal.role = domain::parseRole(responseBody.value("role", "NONE"));

            if (principal.id.empty()) {
                return std::nullopt;
            }
            return principal;

        } catch (const std::exception& e) {
            std::cerr << "[HttpIdentityProvider] Error: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IdentityProviderSettings> settings_;
};

} // namespace transfer::adapters::secondary
