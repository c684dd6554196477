#pragma once

#include "domain/AuditRecord.hpp"
#include "domain/AuditRecordFilter.hpp"
#include "domain/RequestMetadata.hpp"
#include "domain/Page.hpp"
#include <string>

namespace transfer::ports::input {

class IAuditService {
public:
    virtual ~IAuditService() = default;

    /**
     * @brief Журнал аудита по фильтру, новые сверху
     *
     * Сам просмотр пишется в журнал как AUDIT_LOG_VIEWED.
     */
    virtual domain::Page<domain::AuditRecord> listAuditRecords(
        const domain::AuditRecordFilter& filter,
        const std::string& viewerId,
        const domain::RequestMetadata& metadata) = 0;
};

} // namespace transfer::ports::input
