#pragma once

#include "ports/input/IApprovalService.hpp"
#include "ports/output/ITransferStore.hpp"
#include "application/AuditRecorder.hpp"
#include "application/TransferValidator.hpp"
#include "application/TransferExecutor.hpp"
#include "domain/errors/TransferErrors.hpp"
#include <memory>
#include <iostream>

namespace transfer::application {

/**
 * @brief Решения по переводам, ожидающим одобрения
 *
 * Перевод читается с блокировкой строки, поэтому второе параллельное
 * решение увидит уже закоммиченный статус и получит NOT_AWAITING_APPROVAL.
 */
class ApprovalProcessor : public ports::input::IApprovalService {
public:
    ApprovalProcessor(
        std::shared_ptr<ports::output::ITransferStore> store,
        std::shared_ptr<TransferValidator> validator,
        std::shared_ptr<TransferExecutor> executor,
        std::shared_ptr<AuditRecorder> auditRecorder
    ) : store_(std::move(store))
      , validator_(std::move(validator))
      , executor_(std::move(executor))
      , auditRecorder_(std::move(auditRecorder))
    {
        std::cout << "[ApprovalProcessor] Created" << std::endl;
    }

    domain::Transfer decide(const ports::input::DecideApprovalCommand& command) override {
        FailedAttempt attempt;

        try {
            auto uow = store_->begin();

            auto transfer = uow->transfers().lockById(command.transferId);
            if (!transfer) {
                throw domain::WorkflowError(domain::ErrorCode::TRANSFER_NOT_FOUND, "Transfer not found");
            }

            if (!transfer->requiresApproval) {
                throw domain::WorkflowError(
                    domain::ErrorCode::NOT_AWAITING_APPROVAL, "Transfer does not require approval");
            }

            if (transfer->status != domain::TransferStatus::AWAITING_APPROVAL) {
                throw domain::WorkflowError(
                    domain::ErrorCode::NOT_AWAITING_APPROVAL, "Transfer is not awaiting approval");
            }

            if (command.approverId == transfer->initiatedBy) {
                std::cout << "[ApprovalProcessor] Self-approval rejected for " << transfer->id << std::endl;
                throw domain::WorkflowError(
                    domain::ErrorCode::SELF_APPROVAL_FORBIDDEN, "Cannot approve your own transfer");
            }

            auto approval = uow->approvals().findByTransferId(transfer->id);
            if (!approval || approval->status != domain::ApprovalStatus::PENDING) {
                throw domain::WorkflowError(
                    domain::ErrorCode::NOT_AWAITING_APPROVAL, "Transfer is not awaiting approval");
            }

            if (command.decision == domain::Decision::APPROVED) {
                // Баланс мог измениться, пока перевод ждал решения
                uow->accounts().lockPair(transfer->sourceAccountId, transfer->destinationAccountId);
                auto validation = validator_->validate(
                    uow->accounts(), transfer->sourceAccountId, transfer->destinationAccountId, transfer->amount);
                if (!validation.valid) {
                    std::cout << "[ApprovalProcessor] Approval of " << transfer->id
                              << " rejected by validation: " << validation.message << std::endl;
                    throw domain::ValidationError(validation.code, validation.message);
                }
            }

            approval->decide(command.approverId, command.decision, command.notes);
            uow->approvals().update(*approval);

            if (command.decision == domain::Decision::APPROVED) {
                transfer->approve(command.approverId);
                uow->transfers().save(*transfer);

                domain::AuditDetail detail{{"approved_by", command.approverId}};
                detail.setOptional("notes", command.notes);

                attempt.transfer = *transfer;
                attempt.approval = *approval;
                attempt.trail.push_back(auditRecorder_->record(*uow, AuditEntry{
                    .action = domain::AuditAction::TRANSFER_APPROVED,
                    .actorId = command.approverId,
                    .transferId = transfer->id,
                    .accountId = transfer->sourceAccountId,
                    .detail = detail
                }, command.metadata));

                std::cout << "[ApprovalProcessor] Transfer " << transfer->id
                          << " approved by " << command.approverId << std::endl;

                *transfer = executor_->execute(*uow, transfer->id, command.metadata);
            } else {
                transfer->reject(command.approverId);
                uow->transfers().save(*transfer);

                domain::AuditDetail detail{{"rejected_by", command.approverId}};
                detail.setOptional("notes", command.notes);

                auditRecorder_->record(*uow, AuditEntry{
                    .action = domain::AuditAction::TRANSFER_REJECTED,
                    .actorId = command.approverId,
                    .transferId = transfer->id,
                    .accountId = transfer->sourceAccountId,
                    .detail = detail
                }, command.metadata);

                std::cout << "[ApprovalProcessor] Transfer " << transfer->id
                          << " rejected by " << command.approverId << std::endl;
            }

            uow->commit();
            return *transfer;

        } catch (const domain::ExecutionError& e) {
            executor_->recordFailure(attempt, e.what(), command.metadata);
            throw;
        }
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;
    std::shared_ptr<TransferValidator> validator_;
    std::shared_ptr<TransferExecutor> executor_;
    std::shared_ptr<AuditRecorder> auditRecorder_;
};

} // namespace transfer::application
