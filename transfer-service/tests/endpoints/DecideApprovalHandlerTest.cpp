/**
 * @file DecideApprovalHandlerTest.cpp
 * @brief Unit-тесты для DecideApprovalHandler
 *
 * POST /api/v1/approvals: решение по переводу
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/DecideApprovalHandler.hpp"
#include "../mocks/MockServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace transfer;
using namespace transfer::adapters::primary;
using ::testing::_;
using ::testing::Throw;

class DecideApprovalHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockApprovalService_ = std::make_shared<tests::mocks::MockApprovalService>();
        handler_ = std::make_unique<DecideApprovalHandler>(mockApprovalService_);
    }

    SimpleRequest createRequest(const std::string &body)
    {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/api/v1/approvals");
        req.setBody(body);
        req.setAttribute(PRINCIPAL_ID_ATTRIBUTE, "admin-1");
        req.setAttribute(PRINCIPAL_ROLE_ATTRIBUTE, "ADMIN");
        return req;
    }

    domain::Transfer decided(domain::TransferStatus status)
    {
        domain::Transfer transfer("t-100", "acc-a", "acc-b", domain::Money::parse("1500000"), "controller-1");
        transfer.requiresApproval = true;
        transfer.status = status;
        transfer.approvedBy = "admin-1";
        return transfer;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<tests::mocks::MockApprovalService> mockApprovalService_;
    std::unique_ptr<DecideApprovalHandler> handler_;
};

TEST_F(DecideApprovalHandlerTest, Approve_Returns200)
{
    EXPECT_CALL(*mockApprovalService_, decide(_))
        .WillOnce([this](const ports::input::DecideApprovalCommand &cmd)
                  {
            EXPECT_EQ(cmd.transferId, "t-100");
            EXPECT_EQ(cmd.approverId, "admin-1");
            EXPECT_EQ(cmd.decision, domain::Decision::APPROVED);
            EXPECT_EQ(cmd.notes, "ok");
            return decided(domain::TransferStatus::COMPLETED); });

    auto req = createRequest(R"({"transfer_id":"t-100","decision":"APPROVED","notes":"ok"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["message"], "Transfer approved and completed successfully");
    EXPECT_EQ(json["transfer"]["approved_by"], "admin-1");
}

TEST_F(DecideApprovalHandlerTest, Reject_Returns200)
{
    EXPECT_CALL(*mockApprovalService_, decide(_))
        .WillOnce([this](const ports::input::DecideApprovalCommand &cmd)
                  {
            EXPECT_FALSE(cmd.notes.has_value());
            return decided(domain::TransferStatus::REJECTED); });

    auto req = createRequest(R"({"transfer_id":"t-100","decision":"REJECTED"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["message"], "Transfer rejected");
}

TEST_F(DecideApprovalHandlerTest, UnknownDecision_Returns400)
{
    EXPECT_CALL(*mockApprovalService_, decide(_)).Times(0);

    auto req = createRequest(R"({"transfer_id":"t-100","decision":"MAYBE"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Decision must be APPROVED or REJECTED");
}

TEST_F(DecideApprovalHandlerTest, MissingTransferId_Returns400)
{
    auto req = createRequest(R"({"decision":"APPROVED"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Missing required fields: transfer_id, decision");
}

TEST_F(DecideApprovalHandlerTest, SelfApproval_Returns403)
{
    EXPECT_CALL(*mockApprovalService_, decide(_))
        .WillOnce(Throw(domain::WorkflowError(
            domain::ErrorCode::SELF_APPROVAL_FORBIDDEN, "Cannot approve your own transfer")));

    auto req = createRequest(R"({"transfer_id":"t-100","decision":"APPROVED"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
    EXPECT_EQ(parseJson(res.getBody())["code"], "SELF_APPROVAL_FORBIDDEN");
}

TEST_F(DecideApprovalHandlerTest, AlreadyDecided_Returns409)
{
    EXPECT_CALL(*mockApprovalService_, decide(_))
        .WillOnce(Throw(domain::WorkflowError(
            domain::ErrorCode::NOT_AWAITING_APPROVAL, "Transfer is not awaiting approval")));

    auto req = createRequest(R"({"transfer_id":"t-100","decision":"REJECTED"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(DecideApprovalHandlerTest, UnknownTransfer_Returns404)
{
    EXPECT_CALL(*mockApprovalService_, decide(_))
        .WillOnce(Throw(domain::WorkflowError(domain::ErrorCode::TRANSFER_NOT_FOUND, "Transfer not found")));

    auto req = createRequest(R"({"transfer_id":"nope","decision":"APPROVED"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}
