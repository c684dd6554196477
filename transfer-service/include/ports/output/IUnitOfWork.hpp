#pragma once

#include "IAccountRepository.hpp"
#include "ITransferRepository.hpp"
#include "IApprovalRepository.hpp"
#include "IAuditRepository.hpp"

namespace transfer::ports::output {

/**
 * @brief Транзакция хранилища
 *
 * Все репозитории работают в одной транзакции. Если commit() не вызван,
 * деструктор откатывает все изменения.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IAccountRepository& accounts() = 0;
    virtual ITransferRepository& transfers() = 0;
    virtual IApprovalRepository& approvals() = 0;
    virtual IAuditRepository& auditRecords() = 0;

    virtual void commit() = 0;
};

} // namespace transfer::ports::output
