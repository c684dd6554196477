#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITransferService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief POST /api/v1/transfers: создать перевод
     *
     * Body: {"source_account_id", "destination_account_id", "amount", "description"?}
     * amount - число или десятичная строка, не более двух знаков после точки.
     *
     * 201 - перевод исполнен или ждёт одобрения, 400 - проверка не пройдена,
     * 422 - сбой исполнения (перевод записан как FAILED).
     */
    class InitiateTransferHandler : public IHttpHandler
    {
    public:
        explicit InitiateTransferHandler(
            std::shared_ptr<ports::input::ITransferService> transferService) : transferService_(std::move(transferService))
        {
            std::cout << "[InitiateTransferHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
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
                auto body = nlohmann::json::parse(req.getBody());

                if (!body.contains("source_account_id") || !body.contains("destination_account_id") ||
                    !body.contains("amount") || !body["source_account_id"].is_string() ||
                    !body["destination_account_id"].is_string())
                {
                    sendError(res, 400, "Missing required fields: source_account_id, destination_account_id, amount");
                    return;
                }

                auto amount = parseAmount(body["amount"]);
                if (!amount)
                {
                    sendError(res, 400, "Amount must be a decimal number with at most two fractional digits");
                    return;
                }

                ports::input::InitiateTransferCommand command;
                command.sourceAccountId = body["source_account_id"].get<std::string>();
                command.destinationAccountId = body["destination_account_id"].get<std::string>();
                command.amount = *amount;
                command.initiatedBy = principal->id;
                if (body.contains("description") && body["description"].is_string())
                {
                    command.description = body["description"].get<std::string>();
                }
                command.metadata = metadataFrom(req);

                auto transfer = transferService_->initiateTransfer(command);

                nlohmann::json response;
                response["transfer"] = transferToJson(transfer);
                response["message"] = transfer.status == domain::TransferStatus::AWAITING_APPROVAL
                                          ? "Transfer initiated and awaiting approval"
                                          : "Transfer completed successfully";

                res.setResult(201, "application/json", response.dump());
            }
            catch (const nlohmann::json::parse_error &)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::TransferError &e)
            {
                std::cout << "[InitiateTransferHandler] " << domain::toString(e.code()) << ": " << e.what() << std::endl;
                res.setResult(httpStatusFor(e), "application/json", transferErrorToJson(e).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[InitiateTransferHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransferService> transferService_;

        static std::optional<domain::Money> parseAmount(const nlohmann::json &value)
        {
            try
            {
                if (value.is_string())
                {
                    return domain::Money::parse(value.get<std::string>());
                }
                if (value.is_number())
                {
                    return domain::Money::parse(value.dump());
                }
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            return std::nullopt;
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
