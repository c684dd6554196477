#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITransferQueryService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief GET /api/v1/audit/transfers/{id}: история одного перевода, старые сверху
     *
     * Роутер регистрирует с паттерном "/api/v1/audit/transfers/*"
     */
    class GetTransferAuditTrailHandler : public IHttpHandler
    {
    public:
        explicit GetTransferAuditTrailHandler(
            std::shared_ptr<ports::input::ITransferQueryService> queryService) : queryService_(std::move(queryService))
        {
            std::cout << "[GetTransferAuditTrailHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                std::string transferId = req.getPathParam(0).value_or("");
                if (transferId.empty())
                {
                    sendError(res, 400, "Transfer ID is required");
                    return;
                }

                auto trail = queryService_->listAuditTrail(transferId);

                nlohmann::json records = nlohmann::json::array();
                for (const auto &record : trail)
                {
                    records.push_back(auditRecordToJson(record));
                }

                nlohmann::json response;
                response["transfer_id"] = transferId;
                response["records"] = records;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransferAuditTrailHandler] Error: " << e.what() << std::endl;
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
