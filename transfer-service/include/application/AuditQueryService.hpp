#pragma once

#include "ports/input/IAuditService.hpp"
#include "ports/output/ITransferStore.hpp"
#include "application/AuditRecorder.hpp"
#include <memory>
#include <iostream>

namespace transfer::application {

/**
 * @brief Просмотр журнала аудита
 */
class AuditQueryService : public ports::input::IAuditService {
public:
    AuditQueryService(
        std::shared_ptr<ports::output::ITransferStore> store,
        std::shared_ptr<AuditRecorder> auditRecorder
    ) : store_(std::move(store))
      , auditRecorder_(std::move(auditRecorder))
    {
        std::cout << "[AuditQueryService] Created" << std::endl;
    }

    domain::Page<domain::AuditRecord> listAuditRecords(
        const domain::AuditRecordFilter& filter,
        const std::string& viewerId,
        const domain::RequestMetadata& metadata) override
    {
        auto uow = store_->begin();
        auto page = uow->auditRecords().find(filter);

        auditRecorder_->record(*uow, AuditEntry{
            .action = domain::AuditAction::AUDIT_LOG_VIEWED,
            .actorId = viewerId,
            .detail = describe(filter)
        }, metadata);

        uow->commit();
        return page;
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;
    std::shared_ptr<AuditRecorder> auditRecorder_;

    static domain::AuditDetail describe(const domain::AuditRecordFilter& filter) {
        domain::AuditDetail detail;
        detail.setOptional("user_id", filter.actorId);
        detail.setOptional("transfer_id", filter.transferId);
        detail.setOptional("account_id", filter.accountId);
        if (!filter.actions.empty()) {
            std::vector<std::string> actions;
            for (auto action : filter.actions) {
                actions.push_back(domain::toString(action));
            }
            detail.set("actions", actions);
        }
        if (filter.from) {
            detail.set("start_date", filter.from->toString());
        }
        if (filter.to) {
            detail.set("end_date", filter.to->toString());
        }
        detail.set("limit", static_cast<int64_t>(filter.limit));
        detail.set("offset", static_cast<int64_t>(filter.offset));
        return detail;
    }
};

} // namespace transfer::application
