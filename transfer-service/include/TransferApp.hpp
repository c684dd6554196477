// include/TransferApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/IdentityProviderSettings.hpp"

// Ports
#include "ports/input/ITransferService.hpp"
#include "ports/input/IApprovalService.hpp"
#include "ports/input/ITransferQueryService.hpp"
#include "ports/input/IAuditService.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/output/ITransferStore.hpp"
#include "ports/output/IIdentityProvider.hpp"

// Application
#include "application/AuditRecorder.hpp"
#include "application/BalanceValidator.hpp"
#include "application/TransferValidator.hpp"
#include "application/TransferExecutor.hpp"
#include "application/TransferEngine.hpp"
#include "application/ApprovalProcessor.hpp"
#include "application/TransferQueryService.hpp"
#include "application/AuditQueryService.hpp"
#include "application/AccountService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresTransferStore.hpp"
#include "adapters/secondary/HttpIdentityProvider.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/PrincipalExtractorMiddleware.hpp"
#include "adapters/primary/RoleGuardMiddleware.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/InitiateTransferHandler.hpp"
#include "adapters/primary/GetTransfersHandler.hpp"
#include "adapters/primary/GetTransferHandler.hpp"
#include "adapters/primary/GetPendingApprovalsHandler.hpp"
#include "adapters/primary/DecideApprovalHandler.hpp"
#include "adapters/primary/GetAuditRecordsHandler.hpp"
#include "adapters/primary/GetTransferAuditTrailHandler.hpp"
#include "adapters/primary/GetAccountsHandler.hpp"
#include "adapters/primary/GetAccountHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace transfer
{

    /**
     * @brief Transfer Service Application
     *
     * Переводы между счетами с одобрением крупных сумм и журналом аудита.
     * Все /api/v1/* маршруты: PrincipalExtractorMiddleware -> RoleGuardMiddleware -> handler.
     */
    class TransferApp : public BoostBeastApplication
    {
    public:
        TransferApp() { std::cout << "[TransferApp] Initializing..." << std::endl; }
        ~TransferApp() override { std::cout << "[TransferApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[TransferApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[TransferApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::IdentityProviderSettings>().in(di::singleton),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::ITransferStore>().to<adapters::secondary::PostgresTransferStore>().in(di::singleton),
                di::bind<ports::output::IIdentityProvider>().to<adapters::secondary::HttpIdentityProvider>().in(di::singleton),

                di::bind<application::AuditRecorder>().in(di::singleton),
                di::bind<application::BalanceValidator>().in(di::singleton),
                di::bind<application::TransferValidator>().in(di::singleton),
                di::bind<application::TransferExecutor>().in(di::singleton),

                di::bind<ports::input::ITransferService>().to<application::TransferEngine>().in(di::singleton),
                di::bind<ports::input::IApprovalService>().to<application::ApprovalProcessor>().in(di::singleton),
                di::bind<ports::input::ITransferQueryService>().to<application::TransferQueryService>().in(di::singleton),
                di::bind<ports::input::IAuditService>().to<application::AuditQueryService>().in(di::singleton),
                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton));

            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto principalExtractor = injector.create<std::shared_ptr<adapters::primary::PrincipalExtractorMiddleware>>();
            auto secured = [&principalExtractor](domain::Capability capability, std::shared_ptr<IHttpHandler> handler)
            {
                return std::make_shared<adapters::primary::ChainHandler>(
                    principalExtractor,
                    std::make_shared<adapters::primary::RoleGuardMiddleware>(capability),
                    std::move(handler));
            };

            // Переводы
            handlers_[getHandlerKey("POST", "/api/v1/transfers")] = secured(
                domain::Capability::INITIATE_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::InitiateTransferHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/transfers")] = secured(
                domain::Capability::VIEW_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::GetTransfersHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/transfers/*")] = secured(
                domain::Capability::VIEW_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::GetTransferHandler>>());

            // Одобрение
            handlers_[getHandlerKey("GET", "/api/v1/approvals/pending")] = secured(
                domain::Capability::APPROVE_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::GetPendingApprovalsHandler>>());
            handlers_[getHandlerKey("POST", "/api/v1/approvals")] = secured(
                domain::Capability::APPROVE_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::DecideApprovalHandler>>());

            // Аудит
            handlers_[getHandlerKey("GET", "/api/v1/audit")] = secured(
                domain::Capability::VIEW_AUDIT_LOG,
                injector.create<std::shared_ptr<adapters::primary::GetAuditRecordsHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/audit/transfers/*")] = secured(
                domain::Capability::VIEW_AUDIT_LOG,
                injector.create<std::shared_ptr<adapters::primary::GetTransferAuditTrailHandler>>());

            // Счета
            handlers_[getHandlerKey("GET", "/api/v1/accounts")] = secured(
                domain::Capability::VIEW_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::GetAccountsHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/accounts/*")] = secured(
                domain::Capability::VIEW_TRANSFERS,
                injector.create<std::shared_ptr<adapters::primary::GetAccountHandler>>());

            std::cout << "[TransferApp] Ready" << std::endl;
        }
    };

} // namespace transfer
