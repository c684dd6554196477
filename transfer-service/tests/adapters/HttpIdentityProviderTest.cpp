/**
 * @file HttpIdentityProviderTest.cpp
 * @brief Unit-тесты для HttpIdentityProvider
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/HttpIdentityProvider.hpp"
#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace transfer;
using namespace transfer::adapters::secondary;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIdentityProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        settings_ = std::make_shared<settings::IdentityProviderSettings>();
        provider_ = std::make_shared<HttpIdentityProvider>(mockHttpClient_, settings_);
    }

    // Хелпер для настройки mock ответа
    void expectValidate(const std::string& expectedToken, int status, const std::string& body) {
        EXPECT_CALL(*mockHttpClient_, send(_, _))
            .WillOnce([expectedToken, status, body](const IRequest& req, IResponse& res) {
                EXPECT_EQ(req.getPath(), "/api/v1/auth/validate");
                EXPECT_EQ(req.getMethod(), "POST");
                EXPECT_EQ(nlohmann::json::parse(req.getBody())["token"], expectedToken);

                auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
                simpleRes.setStatus(status);
                simpleRes.setBody(body);
                return true;
            });
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    std::shared_ptr<settings::IdentityProviderSettings> settings_;
    std::shared_ptr<HttpIdentityProvider> provider_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(HttpIdentityProviderTest, ValidToken_ReturnsPrincipal) {
    expectValidate("tok-1", 200, R"({"valid":true,"user_id":"admin-1","role":"ADMIN"})");

    auto principal = provider_->resolve("tok-1");

    ASSERT_TRUE(principal.has_value());
    EXPECT_EQ(principal->id, "admin-1");
    EXPECT_EQ(principal->role, domain::Role::ADMIN);
}

TEST_F(HttpIdentityProviderTest, UnknownRole_MapsToNone) {
    expectValidate("tok-2", 200, R"({"valid":true,"user_id":"u-9","role":"SUPERVISOR"})");

    auto principal = provider_->resolve("tok-2");

    ASSERT_TRUE(principal.has_value());
    EXPECT_EQ(principal->role, domain::Role::NONE);
}

TEST_F(HttpIdentityProviderTest, InvalidToken_Nullopt) {
    expectValidate("expired", 200, R"({"valid":false})");

    EXPECT_FALSE(provider_->resolve("expired").has_value());
}

TEST_F(HttpIdentityProviderTest, Unauthorized_Nullopt) {
    expectValidate("tok-3", 401, R"({"error":"Unauthorized"})");

    EXPECT_FALSE(provider_->resolve("tok-3").has_value());
}

TEST_F(HttpIdentityProviderTest, MissingUserId_Nullopt) {
    expectValidate("tok-4", 200, R"({"valid":true,"role":"ADMIN"})");

    EXPECT_FALSE(provider_->resolve("tok-4").has_value());
}

TEST_F(HttpIdentityProviderTest, GarbageBody_Nullopt) {
    expectValidate("tok-5", 200, "<html>");

    EXPECT_FALSE(provider_->resolve("tok-5").has_value());
}

TEST_F(HttpIdentityProviderTest, ServiceUnreachable_Nullopt) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(Return(false));

    EXPECT_FALSE(provider_->resolve("tok-6").has_value());
}

TEST_F(HttpIdentityProviderTest, EmptyToken_NoCall) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).Times(0);

    EXPECT_FALSE(provider_->resolve("").has_value());
}
