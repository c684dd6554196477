#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IIdentityProvider.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief Middleware: bearer-токен -> Principal в attributes запроса.
     *
     * Кладёт principalId и principalRole. Без валидного токена отвечает 401.
     */
    class PrincipalExtractorMiddleware : public IHttpHandler
    {
    public:
        explicit PrincipalExtractorMiddleware(
            std::shared_ptr<ports::output::IIdentityProvider> identityProvider) : identityProvider_(std::move(identityProvider))
        {
            std::cout << "[PrincipalExtractorMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string token = req.getBearerToken().value_or("");
            if (token.empty())
            {
                sendError(res, 401, "Authorization required");
                return;
            }

            auto principal = identityProvider_->resolve(token);
            if (!principal)
            {
                sendError(res, 401, "Invalid or expired token");
                return;
            }

            req.setAttribute(PRINCIPAL_ID_ATTRIBUTE, principal->id);
            req.setAttribute(PRINCIPAL_ROLE_ATTRIBUTE, domain::toString(principal->role));
            res.setStatus(0); // для middleware
        }

    private:
        std::shared_ptr<ports::output::IIdentityProvider> identityProvider_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
