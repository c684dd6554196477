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
     * @brief GET /api/v1/transfers/{id}: карточка перевода
     *
     * Роутер регистрирует с паттерном "/api/v1/transfers/*"
     */
    class GetTransferHandler : public IHttpHandler
    {
    public:
        explicit GetTransferHandler(
            std::shared_ptr<ports::input::ITransferQueryService> queryService) : queryService_(std::move(queryService))
        {
            std::cout << "[GetTransferHandler] Created" << std::endl;
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

                auto details = queryService_->getTransferById(transferId);

                if (!details)
                {
                    sendError(res, 404, "Transfer not found");
                    return;
                }

                res.setResult(200, "application/json", transferDetailsToJson(*details).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransferHandler] Error: " << e.what() << std::endl;
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
