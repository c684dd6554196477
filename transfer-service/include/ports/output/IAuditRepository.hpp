#pragma once

#include "domain/AuditRecord.hpp"
#include "domain/AuditRecordFilter.hpp"
#include "domain/Page.hpp"
#include <string>
#include <vector>

namespace transfer::ports::output {

/**
 * @brief Журнал аудита, только добавление
 */
class IAuditRepository {
public:
    virtual ~IAuditRepository() = default;

    virtual void append(const domain::AuditRecord& record) = 0;

    /**
     * @brief Новые сверху
     */
    virtual domain::Page<domain::AuditRecord> find(const domain::AuditRecordFilter& filter) = 0;

    /**
     * @brief История одного перевода, старые сверху
     */
    virtual std::vector<domain::AuditRecord> findByTransferId(const std::string& transferId) = 0;
};

} // namespace transfer::ports::output
