// transfer-service/include/application/TransferEngine.hpp
#pragma once

#include "ports/input/ITransferService.hpp"
#include "ports/output/ITransferStore.hpp"
#include "application/AuditRecorder.hpp"
#include "application/TransferValidator.hpp"
#include "application/TransferExecutor.hpp"
#include "domain/Approval.hpp"
#include "domain/errors/TransferErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace transfer::application {

/**
 * @brief Создание переводов
 *
 * Архитектура:
 * - блокировка обоих счетов в порядке id -> проверка (TransferValidator),
 *   при ошибке ничего не пишем
 * - сумма <= APPROVAL_THRESHOLD -> исполнение в той же транзакции
 * - сумма > APPROVAL_THRESHOLD -> Approval(PENDING), ждём решения
 * - сбой исполнения -> откат, FAILED пишется отдельной транзакцией
 */
class TransferEngine : public ports::input::ITransferService {
public:
    TransferEngine(
        std::shared_ptr<ports::output::ITransferStore> store,
        std::shared_ptr<TransferValidator> validator,
        std::shared_ptr<TransferExecutor> executor,
        std::shared_ptr<AuditRecorder> auditRecorder
    ) : store_(std::move(store))
      , validator_(std::move(validator))
      , executor_(std::move(executor))
      , auditRecorder_(std::move(auditRecorder))
    {
        std::cout << "[TransferEngine] Created" << std::endl;
    }

    domain::Transfer initiateTransfer(const ports::input::InitiateTransferCommand& command) override {
        domain::Transfer transfer(
            utils::UuidGenerator::generate(),
            command.sourceAccountId,
            command.destinationAccountId,
            command.amount,
            command.initiatedBy);
        transfer.description = command.description;

        FailedAttempt attempt;

        try {
            auto uow = store_->begin();
            uow->accounts().lockPair(command.sourceAccountId, command.destinationAccountId);

            auto validation = validator_->validate(
                uow->accounts(), command.sourceAccountId, command.destinationAccountId, command.amount);
            if (!validation.valid) {
                std::cout << "[TransferEngine] REJECTED: " << validation.message << std::endl;
                throw domain::ValidationError(validation.code, validation.message);
            }

            bool requiresApproval = command.amount > domain::APPROVAL_THRESHOLD;
            if (requiresApproval) {
                transfer.routeForApproval();
            }

            uow->transfers().insert(transfer);
            attempt.transfer = transfer;

            attempt.trail.push_back(auditRecorder_->record(*uow, AuditEntry{
                .action = domain::AuditAction::TRANSFER_INITIATED,
                .actorId = command.initiatedBy,
                .transferId = transfer.id,
                .accountId = transfer.sourceAccountId,
                .detail = {
                    {"from_account_id", transfer.sourceAccountId},
                    {"to_account_id", transfer.destinationAccountId},
                    {"amount", transfer.amount},
                    {"requires_approval", requiresApproval}
                }
            }, command.metadata));

            attempt.trail.push_back(auditRecorder_->record(*uow, AuditEntry{
                .action = domain::AuditAction::TRANSFER_VALIDATED,
                .actorId = command.initiatedBy,
                .transferId = transfer.id,
                .accountId = transfer.sourceAccountId,
                .detail = {{"validation_passed", true}}
            }, command.metadata));

            if (requiresApproval) {
                uow->approvals().insert(domain::Approval(utils::UuidGenerator::generate(), transfer.id));

                auditRecorder_->record(*uow, AuditEntry{
                    .action = domain::AuditAction::TRANSFER_AWAITING_APPROVAL,
                    .actorId = command.initiatedBy,
                    .transferId = transfer.id,
                    .accountId = transfer.sourceAccountId,
                    .detail = {
                        {"amount", transfer.amount},
                        {"threshold", domain::APPROVAL_THRESHOLD}
                    }
                }, command.metadata);

                std::cout << "[TransferEngine] Transfer " << transfer.id
                          << " awaiting approval (" << transfer.amount.toString() << ")" << std::endl;
            } else {
                transfer = executor_->execute(*uow, transfer.id, command.metadata);
            }

            uow->commit();

        } catch (const domain::ExecutionError& e) {
            executor_->recordFailure(attempt, e.what(), command.metadata);
            throw;
        }

        return transfer;
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;
    std::shared_ptr<TransferValidator> validator_;
    std::shared_ptr<TransferExecutor> executor_;
    std::shared_ptr<AuditRecorder> auditRecorder_;
};

} // namespace transfer::application
