#pragma once

#include <gmock/gmock.h>

#include "ports/input/ITransferService.hpp"
#include "ports/input/IApprovalService.hpp"
#include "ports/input/ITransferQueryService.hpp"
#include "ports/input/IAuditService.hpp"
#include "ports/input/IAccountService.hpp"

namespace transfer::tests::mocks {

/**
 * @brief gmock-реализации входных портов для тестов обработчиков
 */
class MockTransferService : public ports::input::ITransferService {
public:
    MOCK_METHOD(domain::Transfer, initiateTransfer, (const ports::input::InitiateTransferCommand&), (override));
};

class MockApprovalService : public ports::input::IApprovalService {
public:
    MOCK_METHOD(domain::Transfer, decide, (const ports::input::DecideApprovalCommand&), (override));
};

class MockTransferQueryService : public ports::input::ITransferQueryService {
public:
    MOCK_METHOD(std::optional<domain::TransferDetails>, getTransferById, (const std::string&), (override));
    MOCK_METHOD(domain::Page<domain::Transfer>, listTransfers, (const domain::TransferFilter&), (override));
    MOCK_METHOD(std::vector<domain::Transfer>, listPendingApprovals, (const std::string&), (override));
    MOCK_METHOD(std::vector<domain::AuditRecord>, listAuditTrail, (const std::string&), (override));
};

class MockAuditService : public ports::input::IAuditService {
public:
    MOCK_METHOD(domain::Page<domain::AuditRecord>, listAuditRecords,
                (const domain::AuditRecordFilter&, const std::string&, const domain::RequestMetadata&), (override));
};

class MockAccountService : public ports::input::IAccountService {
public:
    MOCK_METHOD(std::vector<domain::Account>, listAccounts, (), (override));
    MOCK_METHOD(std::optional<domain::Account>, getAccount,
                (const std::string&, const std::optional<std::string>&, const domain::RequestMetadata&), (override));
    MOCK_METHOD(domain::Page<domain::Transfer>, getAccountHistory, (const std::string&, int, int), (override));
    MOCK_METHOD(std::optional<domain::AccountDetails>, getAccountDetails,
                (const std::string&, const std::string&, int, int, const domain::RequestMetadata&), (override));
};

} // namespace transfer::tests::mocks
