#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAccountService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts/{id}: счёт и история переводов
     *
     * Роутер регистрирует с паттерном "/api/v1/accounts/*".
     * Query: limit (50), offset (0) для истории.
     */
    class GetAccountHandler : public IHttpHandler
    {
    public:
        explicit GetAccountHandler(
            std::shared_ptr<ports::input::IAccountService> accountService) : accountService_(std::move(accountService))
        {
            std::cout << "[GetAccountHandler] Created" << std::endl;
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

            int limit = 0;
            int offset = 0;
            try
            {
                limit = queryInt(req, "limit", 50, 1, 500);
                offset = queryInt(req, "offset", 0, 0, 1000000);
            }
            catch (const std::invalid_argument &e)
            {
                sendError(res, 400, e.what());
                return;
            }

            try
            {
                std::string accountId = req.getPathParam(0).value_or("");
                if (accountId.empty())
                {
                    sendError(res, 400, "Account ID is required");
                    return;
                }

                auto details = accountService_->getAccountDetails(
                    accountId, principal->id, limit, offset, metadataFrom(req));
                if (!details)
                {
                    sendError(res, 404, "Account not found");
                    return;
                }

                nlohmann::json transfers = nlohmann::json::array();
                for (const auto &transfer : details->history.items)
                {
                    transfers.push_back(transferToJson(transfer));
                }

                nlohmann::json response;
                response["account"] = accountToJson(details->account);
                response["transfers"] = transfers;
                response["total"] = details->history.total;
                response["limit"] = limit;
                response["offset"] = offset;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetAccountHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
