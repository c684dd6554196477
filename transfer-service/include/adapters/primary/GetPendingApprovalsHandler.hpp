#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITransferQueryService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief GET /api/v1/approvals/pending: очередь на одобрение
     *
     * Свои переводы в очередь не попадают, одобрить их всё равно нельзя.
     */
    class GetPendingApprovalsHandler : public IHttpHandler
    {
    public:
        explicit GetPendingApprovalsHandler(
            std::shared_ptr<ports::input::ITransferQueryService> queryService) : queryService_(std::move(queryService))
        {
            std::cout << "[GetPendingApprovalsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            auto principal = principalFrom(req);
            if (!principal)
            {
                sendError(res, 401, "Authorization required");
                return;
            }

            try
            {
                auto pending = queryService_->listPendingApprovals(principal->id);

                nlohmann::json transfers = nlohmann::json::array();
                for (const auto &transfer : pending)
                {
                    transfers.push_back(transferToJson(transfer));
                }

                nlohmann::json response;
                response["transfers"] = transfers;
                response["count"] = pending.size();

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetPendingApprovalsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransferQueryService> queryService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
