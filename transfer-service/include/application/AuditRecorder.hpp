#pragma once

#include "ports/output/ITransferStore.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/RequestMetadata.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <iostream>

namespace transfer::application {

/**
 * @brief Что записать в журнал аудита
 */
struct AuditEntry {
    domain::AuditAction action = domain::AuditAction::TRANSFER_INITIATED;
    std::optional<std::string> actorId;
    std::optional<std::string> transferId;
    std::optional<std::string> accountId;
    domain::AuditDetail detail;
};

/**
 * @brief Запись событий в журнал аудита
 *
 * Только добавление. Бизнес-ошибок не бросает, ошибки хранилища пробрасывает.
 */
class AuditRecorder {
public:
    explicit AuditRecorder(std::shared_ptr<ports::output::ITransferStore> store)
        : store_(std::move(store))
    {
        std::cout << "[AuditRecorder] Created" << std::endl;
    }

    /**
     * @brief Записать в транзакции вызывающего
     * @return Записанная запись (с id и временем)
     */
    domain::AuditRecord record(
        ports::output::IUnitOfWork& uow,
        const AuditEntry& entry,
        const domain::RequestMetadata& metadata)
    {
        auto auditRecord = build(entry, metadata);
        uow.auditRecords().append(auditRecord);
        return auditRecord;
    }

    /**
     * @brief Записать в отдельной короткой транзакции
     */
    domain::AuditRecord record(const AuditEntry& entry, const domain::RequestMetadata& metadata) {
        auto uow = store_->begin();
        auto auditRecord = record(*uow, entry, metadata);
        uow->commit();
        return auditRecord;
    }

    /**
     * @brief Повторно записать уже построенную запись (после отката транзакции)
     */
    void replay(ports::output::IUnitOfWork& uow, const domain::AuditRecord& auditRecord) {
        uow.auditRecords().append(auditRecord);
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;

    static domain::AuditRecord build(const AuditEntry& entry, const domain::RequestMetadata& metadata) {
        domain::AuditRecord auditRecord;
        auditRecord.id = utils::UuidGenerator::generate();
        auditRecord.action = entry.action;
        auditRecord.actorId = entry.actorId;
        auditRecord.transferId = entry.transferId;
        auditRecord.accountId = entry.accountId;
        auditRecord.detail = entry.detail;
        auditRecord.originAddress = metadata.originAddress;
        auditRecord.clientInfo = metadata.clientInfo;
        auditRecord.createdAt = domain::Timestamp::now();
        return auditRecord;
    }
};

} // namespace transfer::application
