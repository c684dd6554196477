/**
 * @file GetTransferHandlerTest.cpp
 * @brief Unit-тесты для GetTransferHandler
 *
 * GET /api/v1/transfers/{id}: карточка перевода
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/GetTransferHandler.hpp"
#include "../mocks/MockServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace transfer;
using namespace transfer::adapters::primary;
using ::testing::Return;

class GetTransferHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockQueryService_ = std::make_shared<tests::mocks::MockTransferQueryService>();
        handler_ = std::make_unique<GetTransferHandler>(mockQueryService_);
    }

    SimpleRequest createRequest(const std::string &path)
    {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath(path);
        req.setPathPattern("/api/v1/transfers/*");
        return req;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<tests::mocks::MockTransferQueryService> mockQueryService_;
    std::unique_ptr<GetTransferHandler> handler_;
};

TEST_F(GetTransferHandlerTest, Found_ReturnsDetails)
{
    domain::TransferDetails details;
    details.transfer = domain::Transfer("t-42", "acc-a", "acc-b", domain::Money::parse("1500000"), "controller-1");
    details.transfer.routeForApproval();
    details.sourceAccount = domain::AccountSummary{"acc-a", "1001", "Treasury"};
    details.approval = domain::Approval("ap-1", "t-42");

    EXPECT_CALL(*mockQueryService_, getTransferById("t-42"))
        .WillOnce(Return(details));

    auto req = createRequest("/api/v1/transfers/t-42");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["transfer"]["status"], "AWAITING_APPROVAL");
    EXPECT_EQ(json["transfer"]["amount"], "1500000.00");
    EXPECT_EQ(json["source_account"]["account_number"], "1001");
    EXPECT_TRUE(json["destination_account"].is_null());
    EXPECT_EQ(json["approval"]["status"], "PENDING");
    EXPECT_TRUE(json["approval"]["decision"].is_null());
}

TEST_F(GetTransferHandlerTest, NotFound_Returns404)
{
    EXPECT_CALL(*mockQueryService_, getTransferById("missing"))
        .WillOnce(Return(std::nullopt));

    auto req = createRequest("/api/v1/transfers/missing");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Transfer not found");
}
