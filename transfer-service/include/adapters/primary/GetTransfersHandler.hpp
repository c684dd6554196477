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
     * @brief GET /api/v1/transfers: список переводов, новые сверху
     *
     * Query: account_id, initiated_by, status, start_date, end_date, limit (50), offset (0)
     */
    class GetTransfersHandler : public IHttpHandler
    {
    public:
        explicit GetTransfersHandler(
            std::shared_ptr<ports::input::ITransferQueryService> queryService) : queryService_(std::move(queryService))
        {
            std::cout << "[GetTransfersHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            domain::TransferFilter filter;
            try
            {
                filter.accountId = queryText(req, "account_id");
                filter.initiatedBy = queryText(req, "initiated_by");
                if (auto status = queryText(req, "status"))
                {
                    filter.status = domain::parseTransferStatus(*status);
                }
                filter.from = queryTimestamp(req, "start_date");
                filter.to = queryTimestamp(req, "end_date");
                filter.limit = queryInt(req, "limit", 50, 1, 500);
                filter.offset = queryInt(req, "offset", 0, 0, 1000000);
            }
            catch (const std::invalid_argument &e)
            {
                sendError(res, 400, e.what());
                return;
            }

            try
            {
                auto page = queryService_->listTransfers(filter);

                nlohmann::json transfers = nlohmann::json::array();
                for (const auto &transfer : page.items)
                {
                    transfers.push_back(transferToJson(transfer));
                }

                nlohmann::json response;
                response["transfers"] = transfers;
                response["total"] = page.total;
                response["limit"] = filter.limit;
                response["offset"] = filter.offset;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransfersHandler] Error: " << e.what() << std::endl;
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
