#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IApprovalService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief POST /api/v1/approvals: решение по переводу
     *
     * Body: {"transfer_id", "decision": "APPROVED" | "REJECTED", "notes"?}
     */
    class DecideApprovalHandler : public IHttpHandler
    {
    public:
        explicit DecideApprovalHandler(
            std::shared_ptr<ports::input::IApprovalService> approvalService) : approvalService_(std::move(approvalService))
        {
            std::cout << "[DecideApprovalHandler] Created" << std::endl;
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

                if (!body.contains("transfer_id") || !body.contains("decision") ||
                    !body["transfer_id"].is_string() || !body["decision"].is_string())
                {
                    sendError(res, 400, "Missing required fields: transfer_id, decision");
                    return;
                }

                ports::input::DecideApprovalCommand command;
                command.transferId = body["transfer_id"].get<std::string>();
                command.approverId = principal->id;
                try
                {
                    command.decision = domain::parseDecision(body["decision"].get<std::string>());
                }
                catch (const std::invalid_argument &e)
                {
                    sendError(res, 400, e.what());
                    return;
                }
                if (body.contains("notes") && body["notes"].is_string())
                {
                    command.notes = body["notes"].get<std::string>();
                }
                command.metadata = metadataFrom(req);

                auto transfer = approvalService_->decide(command);

                nlohmann::json response;
                response["transfer"] = transferToJson(transfer);
                response["message"] = command.decision == domain::Decision::APPROVED
                                          ? "Transfer approved and completed successfully"
                                          : "Transfer rejected";

                res.setResult(200, "application/json", response.dump());
            }
            catch (const nlohmann::json::parse_error &)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::TransferError &e)
            {
                std::cout << "[DecideApprovalHandler] " << domain::toString(e.code()) << ": " << e.what() << std::endl;
                res.setResult(httpStatusFor(e), "application/json", transferErrorToJson(e).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[DecideApprovalHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IApprovalService> approvalService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
