#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAccountService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts: активные счета
     */
    class GetAccountsHandler : public IHttpHandler
    {
    public:
        explicit GetAccountsHandler(
            std::shared_ptr<ports::input::IAccountService> accountService) : accountService_(std::move(accountService))
        {
            std::cout << "[GetAccountsHandler] Created" << std::endl;
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
                nlohmann::json accounts = nlohmann::json::array();
                for (const auto &account : accountService_->listAccounts())
                {
                    accounts.push_back(accountToJson(account));
                }

                nlohmann::json response;
                response["accounts"] = accounts;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetAccountsHandler] Error: " << e.what() << std::endl;
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
