#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuditService.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestContext.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <sstream>
#include <iostream>

namespace transfer::adapters::primary
{

    /**
     * @brief GET /api/v1/audit: журнал аудита
     *
     * Query: user_id, transfer_id, account_id, action (через запятую),
     * start_date, end_date, limit (50), offset (0)
     */
    class GetAuditRecordsHandler : public IHttpHandler
    {
    public:
        explicit GetAuditRecordsHandler(
            std::shared_ptr<ports::input::IAuditService> auditService) : auditService_(std::move(auditService))
        {
            std::cout << "[GetAuditRecordsHandler] Created" << std::endl;
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

            domain::AuditRecordFilter filter;
            try
            {
                filter.actorId = queryText(req, "user_id");
                filter.transferId = queryText(req, "transfer_id");
                filter.accountId = queryText(req, "account_id");
                if (auto actions = queryText(req, "action"))
                {
                    std::istringstream list(*actions);
                    std::string action;
                    while (std::getline(list, action, ','))
                    {
                        if (!action.empty())
                        {
                            filter.actions.push_back(domain::parseAuditAction(action));
                        }
                    }
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
                auto page = auditService_->listAuditRecords(filter, principal->id, metadataFrom(req));

                nlohmann::json records = nlohmann::json::array();
                for (const auto &record : page.items)
                {
                    records.push_back(auditRecordToJson(record));
                }

                nlohmann::json response;
                response["records"] = records;
                response["total"] = page.total;
                response["limit"] = filter.limit;
                response["offset"] = filter.offset;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetAuditRecordsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAuditService> auditService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
