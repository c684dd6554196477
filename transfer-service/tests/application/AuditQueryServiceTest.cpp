/**
 * @file AuditQueryServiceTest.cpp
 * @brief Unit-тесты для AuditQueryService
 */

#include <gtest/gtest.h>

#include "application/AuditQueryService.hpp"
#include "../mocks/InMemoryTransferStore.hpp"

using namespace transfer;
using namespace transfer::application;
using namespace transfer::domain;

class AuditQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<tests::mocks::InMemoryTransferStore>();
        recorder_ = std::make_shared<AuditRecorder>(store_);
        service_ = std::make_unique<AuditQueryService>(store_, recorder_);

        metadata_.originAddress = "192.168.1.10";
        metadata_.clientInfo = "Mozilla/5.0";
    }

    void seed(AuditAction action, const std::string& actor, const std::string& transferId) {
        recorder_->record(AuditEntry{
            .action = action,
            .actorId = actor,
            .transferId = transferId,
            .accountId = "acc-a"
        }, RequestMetadata{});
    }

    std::shared_ptr<tests::mocks::InMemoryTransferStore> store_;
    std::shared_ptr<AuditRecorder> recorder_;
    std::unique_ptr<AuditQueryService> service_;
    RequestMetadata metadata_;
};

TEST_F(AuditQueryServiceTest, ListAuditRecords_NewestFirst) {
    seed(AuditAction::TRANSFER_INITIATED, "controller-1", "t-1");
    seed(AuditAction::TRANSFER_COMPLETED, "controller-1", "t-1");

    auto page = service_->listAuditRecords(AuditRecordFilter{}, "auditor-1", metadata_);

    EXPECT_EQ(page.total, 2);
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].action, AuditAction::TRANSFER_COMPLETED);
}

TEST_F(AuditQueryServiceTest, ListAuditRecords_RecordsTheViewing) {
    seed(AuditAction::TRANSFER_INITIATED, "controller-1", "t-1");

    AuditRecordFilter filter;
    filter.transferId = "t-1";
    filter.actions = {AuditAction::TRANSFER_INITIATED, AuditAction::TRANSFER_FAILED};
    filter.limit = 20;
    service_->listAuditRecords(filter, "auditor-1", metadata_);

    auto records = store_->auditRecords();
    ASSERT_EQ(records.size(), 2u);
    const auto& viewed = records.back();
    EXPECT_EQ(viewed.action, AuditAction::AUDIT_LOG_VIEWED);
    EXPECT_EQ(viewed.actorId, "auditor-1");
    EXPECT_FALSE(viewed.transferId.has_value());
    EXPECT_EQ(viewed.originAddress, "192.168.1.10");
    EXPECT_EQ(viewed.clientInfo, "Mozilla/5.0");
    EXPECT_EQ(viewed.detail.get<std::string>("transfer_id"), "t-1");
    EXPECT_EQ(viewed.detail.get<int64_t>("limit"), 20);
    EXPECT_EQ(viewed.detail.get<int64_t>("offset"), 0);
    EXPECT_EQ(viewed.detail.get<std::vector<std::string>>("actions"),
              (std::vector<std::string>{"TRANSFER_INITIATED", "TRANSFER_FAILED"}));
}

TEST_F(AuditQueryServiceTest, ListAuditRecords_ViewingNotInOwnResult) {
    auto page = service_->listAuditRecords(AuditRecordFilter{}, "auditor-1", metadata_);
    EXPECT_EQ(page.total, 0);

    auto next = service_->listAuditRecords(AuditRecordFilter{}, "auditor-1", metadata_);
    EXPECT_EQ(next.total, 1);
    EXPECT_EQ(next.items[0].action, AuditAction::AUDIT_LOG_VIEWED);
}

TEST_F(AuditQueryServiceTest, ListAuditRecords_FilterByActorAndAction) {
    seed(AuditAction::TRANSFER_INITIATED, "controller-1", "t-1");
    seed(AuditAction::TRANSFER_INITIATED, "controller-2", "t-2");
    seed(AuditAction::TRANSFER_APPROVED, "admin-1", "t-2");

    AuditRecordFilter filter;
    filter.actorId = "controller-2";
    filter.actions = {AuditAction::TRANSFER_INITIATED};
    auto page = service_->listAuditRecords(filter, "auditor-1", metadata_);

    ASSERT_EQ(page.total, 1);
    EXPECT_EQ(page.items[0].transferId, "t-2");
}
