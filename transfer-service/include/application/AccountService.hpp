#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/ITransferStore.hpp"
#include "application/AuditRecorder.hpp"
#include <memory>
#include <iostream>

namespace transfer::application {

/**
 * @brief Счета и история переводов по счёту
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::ITransferStore> store,
        std::shared_ptr<AuditRecorder> auditRecorder
    ) : store_(std::move(store))
      , auditRecorder_(std::move(auditRecorder))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    std::vector<domain::Account> listAccounts() override {
        auto uow = store_->begin();
        auto accounts = uow->accounts().findAllActive();
        uow->commit();
        return accounts;
    }

    std::optional<domain::Account> getAccount(
        const std::string& accountId,
        const std::optional<std::string>& viewerId,
        const domain::RequestMetadata& metadata) override
    {
        auto uow = store_->begin();

        auto account = uow->accounts().findById(accountId);
        if (account && viewerId) {
            auditRecorder_->record(*uow, AuditEntry{
                .action = domain::AuditAction::ACCOUNT_VIEWED,
                .actorId = *viewerId,
                .accountId = account->id,
                .detail = {{"account_number", account->accountNumber}}
            }, metadata);
        }

        uow->commit();
        return account;
    }

    domain::Page<domain::Transfer> getAccountHistory(const std::string& accountId, int limit, int offset) override {
        domain::TransferFilter filter;
        filter.accountId = accountId;
        filter.limit = limit;
        filter.offset = offset;

        auto uow = store_->begin();
        auto page = uow->transfers().find(filter);
        uow->commit();
        return page;
    }

    std::optional<domain::AccountDetails> getAccountDetails(
        const std::string& accountId,
        const std::string& viewerId,
        int limit,
        int offset,
        const domain::RequestMetadata& metadata) override
    {
        auto uow = store_->begin();

        // FOR SHARE: переводы по счёту ждут конца чтения
        auto account = uow->accounts().lockSharedById(accountId);
        if (!account) {
            uow->commit();
            return std::nullopt;
        }

        auditRecorder_->record(*uow, AuditEntry{
            .action = domain::AuditAction::ACCOUNT_VIEWED,
            .actorId = viewerId,
            .accountId = account->id,
            .detail = {{"account_number", account->accountNumber}}
        }, metadata);

        domain::TransferFilter filter;
        filter.accountId = accountId;
        filter.limit = limit;
        filter.offset = offset;
        auto history = uow->transfers().find(filter);

        uow->commit();
        return domain::AccountDetails{*account, history};
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;
    std::shared_ptr<AuditRecorder> auditRecorder_;
};

} // namespace transfer::application
