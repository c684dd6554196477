#pragma once

#include "ports/input/ITransferQueryService.hpp"
#include "ports/output/ITransferStore.hpp"
#include <memory>
#include <iostream>

namespace transfer::application {

/**
 * @brief Чтение переводов, очереди одобрения и истории перевода
 */
class TransferQueryService : public ports::input::ITransferQueryService {
public:
    explicit TransferQueryService(std::shared_ptr<ports::output::ITransferStore> store)
        : store_(std::move(store))
    {
        std::cout << "[TransferQueryService] Created" << std::endl;
    }

    std::optional<domain::TransferDetails> getTransferById(const std::string& transferId) override {
        auto uow = store_->begin();

        auto transfer = uow->transfers().findById(transferId);
        if (!transfer) {
            return std::nullopt;
        }

        domain::TransferDetails details;
        details.transfer = *transfer;
        details.sourceAccount = summaryOf(uow->accounts(), transfer->sourceAccountId);
        details.destinationAccount = summaryOf(uow->accounts(), transfer->destinationAccountId);
        details.approval = uow->approvals().findByTransferId(transfer->id);

        uow->commit();
        return details;
    }

    domain::Page<domain::Transfer> listTransfers(const domain::TransferFilter& filter) override {
        auto uow = store_->begin();
        auto page = uow->transfers().find(filter);
        uow->commit();
        return page;
    }

    std::vector<domain::Transfer> listPendingApprovals(const std::string& excludingActor) override {
        auto uow = store_->begin();
        auto transfers = uow->transfers().findAwaitingApproval(excludingActor);
        uow->commit();
        return transfers;
    }

    std::vector<domain::AuditRecord> listAuditTrail(const std::string& transferId) override {
        auto uow = store_->begin();
        auto trail = uow->auditRecords().findByTransferId(transferId);
        uow->commit();
        return trail;
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;

    static std::optional<domain::AccountSummary> summaryOf(
        ports::output::IAccountRepository& accounts, const std::string& accountId)
    {
        auto account = accounts.findById(accountId);
        if (!account) {
            return std::nullopt;
        }
        return domain::AccountSummary{account->id, account->accountNumber, account->name};
    }
};

} // namespace transfer::application
