#pragma once

#include "application/AuditRecorder.hpp"
#include "ports/output/ITransferStore.hpp"
#include "domain/Transfer.hpp"
#include "domain/Approval.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/RequestMetadata.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <iostream>

namespace transfer::application {

/**
 * @brief Попытка исполнения, которая откатилась
 *
 * transfer и approval в том виде, в каком они были бы записаны до движения денег.
 * trail - записи аудита, сделанные в откатившейся транзакции.
 */
struct FailedAttempt {
    domain::Transfer transfer;
    std::optional<domain::Approval> approval;
    std::vector<domain::AuditRecord> trail;
};

/**
 * @brief Исполнение перевода: списание, зачисление, COMPLETED
 *
 * Бизнес-проверок не делает, их выполняет вызывающий. Ограничения
 * хранилища (баланс не ниже нуля) проверяет само хранилище.
 * Строки обоих счетов вызывающий блокирует заранее (lockPair).
 * В аудите COMPLETED и FAILED актор - инициатор перевода.
 */
class TransferExecutor {
public:
    TransferExecutor(
        std::shared_ptr<ports::output::ITransferStore> store,
        std::shared_ptr<AuditRecorder> auditRecorder
    ) : store_(std::move(store))
      , auditRecorder_(std::move(auditRecorder))
    {
        std::cout << "[TransferExecutor] Created" << std::endl;
    }

    /**
     * @brief Исполнить перевод в транзакции вызывающего
     *
     * @param transferId перевод в статусе PENDING или APPROVED
     * @throws domain::ExecutionError любой сбой; вызывающий должен откатить транзакцию
     */
    domain::Transfer execute(
        ports::output::IUnitOfWork& uow,
        const std::string& transferId,
        const domain::RequestMetadata& metadata)
    {
        try {
            auto transfer = uow.transfers().findById(transferId);
            if (!transfer) {
                throw std::runtime_error("Transfer not found: " + transferId);
            }

            uow.accounts().debit(transfer->sourceAccountId, transfer->amount);
            uow.accounts().credit(transfer->destinationAccountId, transfer->amount);

            transfer->complete();
            uow.transfers().save(*transfer);

            auditRecorder_->record(uow, AuditEntry{
                .action = domain::AuditAction::TRANSFER_COMPLETED,
                .actorId = transfer->initiatedBy,
                .transferId = transfer->id,
                .accountId = transfer->sourceAccountId,
                .detail = {
                    {"from_account_id", transfer->sourceAccountId},
                    {"to_account_id", transfer->destinationAccountId},
                    {"amount", transfer->amount}
                }
            }, metadata);

            std::cout << "[TransferExecutor] Completed " << transfer->id
                      << ": " << transfer->amount.toString()
                      << " " << transfer->sourceAccountId << " -> " << transfer->destinationAccountId << std::endl;
            return *transfer;

        } catch (const std::exception& e) {
            std::cerr << "[TransferExecutor] Execution of " << transferId << " failed: " << e.what() << std::endl;
            throw domain::ExecutionError(transferId, e.what());
        }
    }

    /**
     * @brief Записать FAILED в отдельной транзакции после отката попытки
     *
     * Вместе с переводом восстанавливаются решение по заявке и аудит попытки,
     * затем добавляется TRANSFER_FAILED.
     *
     * @return Перевод в статусе FAILED
     */
    domain::Transfer recordFailure(
        const FailedAttempt& attempt,
        const std::string& error,
        const domain::RequestMetadata& metadata)
    {
        auto failed = attempt.transfer;
        failed.fail(error);

        auto uow = store_->begin();
        uow->transfers().save(failed);
        if (attempt.approval) {
            uow->approvals().update(*attempt.approval);
        }
        for (const auto& auditRecord : attempt.trail) {
            auditRecorder_->replay(*uow, auditRecord);
        }
        auditRecorder_->record(*uow, AuditEntry{
            .action = domain::AuditAction::TRANSFER_FAILED,
            .actorId = failed.initiatedBy,
            .transferId = failed.id,
            .accountId = failed.sourceAccountId,
            .detail = {{"error", error}}
        }, metadata);
        uow->commit();

        std::cout << "[TransferExecutor] Transfer " << failed.id << " marked FAILED" << std::endl;
        return failed;
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;
    std::shared_ptr<AuditRecorder> auditRecorder_;
};

} // namespace transfer::application
