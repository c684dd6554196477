#pragma once

#include <IHttpHandler.hpp>
#include "domain/access/RolePolicy.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief Middleware: проверка права роли на действие, иначе 403.
     *
     * Ставится после PrincipalExtractorMiddleware.
     */
    class RoleGuardMiddleware : public IHttpHandler
    {
    public:
        explicit RoleGuardMiddleware(domain::Capability capability) : capability_(capability) {}

        void handle(IRequest &req, IResponse &res) override
        {
            auto principal = principalFrom(req);
            if (!principal)
            {
                sendError(res, 401, "Authorization required");
                return;
            }

            auto policy = domain::makeRolePolicy(principal->role);
            if (!policy->allows(capability_))
            {
                std::cout << "[RoleGuardMiddleware] " << principal->id << " (" << domain::toString(principal->role)
                          << ") denied " << domain::toString(capability_) << std::endl;
                sendError(res, 403, "Insufficient permissions");
                return;
            }

            res.setStatus(0); // для middleware
        }

    private:
        domain::Capability capability_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
