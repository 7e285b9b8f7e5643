/**
 * @file RootPageHandlerTest.cpp
 * @brief Unit-тесты для RootPageHandler
 *
 * GET / - QuickConnect код, затем логин и пароль для HereSphere
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/RootPageHandler.hpp"
#include "mocks/MockAuthService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

using namespace jellyvr;
using namespace jellyvr::adapters::primary;
using namespace jellyvr::tests::mocks;
using ::testing::_;
using ::testing::Return;
using ::testing::Eq;
using ::testing::Invoke;
using ports::input::LoginStatus;

// ============================================================================
// Test Fixture
// ============================================================================

class RootPageHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockAuthService_ = std::make_shared<MockAuthService>();
        handler_ = std::make_unique<RootPageHandler>(mockAuthService_);
    }

    SimpleRequest createRequest(const std::string &cookie = "", const std::string &path = "/")
    {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath(path);
        req.setHeader("Host", "vr.local:3000");
        if (!cookie.empty())
        {
            req.setHeader("Cookie", cookie);
        }
        return req;
    }

    static LoginStatus status(LoginStatus::State state)
    {
        LoginStatus s;
        s.state = state;
        s.displayCode = "ABC123";
        return s;
    }

    std::shared_ptr<MockAuthService> mockAuthService_;
    std::unique_ptr<RootPageHandler> handler_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(RootPageHandlerTest, NoCookie_StartsLoginAndSetsCookie)
{
    EXPECT_CALL(*mockAuthService_, pollLogin(_)).Times(0);
    EXPECT_CALL(*mockAuthService_, startLogin(Eq(std::optional<std::string>())))
        .WillOnce(Return(domain::QuickConnectRequest("secret-1", "ABC123")));

    auto req = createRequest();
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.getBody().find("ABC123"), std::string::npos);
    EXPECT_NE(res.getBody().find("http-equiv=\"refresh\""), std::string::npos);
    auto setCookie = res.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_EQ(setCookie->rfind("jellyvr_session=secret-1;", 0), 0u);
}

TEST_F(RootPageHandlerTest, PendingCookie_ShowsSameCode)
{
    EXPECT_CALL(*mockAuthService_, pollLogin("secret-1"))
        .WillOnce(Return(status(LoginStatus::State::PENDING)));
    EXPECT_CALL(*mockAuthService_, startLogin(_)).Times(0);

    auto req = createRequest("theme=dark; jellyvr_session=secret-1");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.getBody().find("ABC123"), std::string::npos);
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

TEST_F(RootPageHandlerTest, ActiveWithPassword_ShowsCredentialsOnce)
{
    auto active = status(LoginStatus::State::ACTIVE);
    active.identity = domain::SessionIdentity{"sess-1", "user-1", "alice"};
    active.oneTimePassword = "qwerty";
    EXPECT_CALL(*mockAuthService_, pollLogin("secret-1")).WillOnce(Return(active));

    auto req = createRequest("jellyvr_session=secret-1");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.getBody().find("alice"), std::string::npos);
    EXPECT_NE(res.getBody().find("qwerty"), std::string::npos);
    EXPECT_NE(res.getBody().find("http://vr.local:3000/heresphere"), std::string::npos);
    EXPECT_EQ(res.getBody().find("http-equiv=\"refresh\""), std::string::npos);
}

TEST_F(RootPageHandlerTest, ActiveWithoutPassword_DoesNotLeakPassword)
{
    auto active = status(LoginStatus::State::ACTIVE);
    active.identity = domain::SessionIdentity{"sess-1", "user-1", "<alice>"};
    EXPECT_CALL(*mockAuthService_, pollLogin("secret-1")).WillOnce(Return(active));

    auto req = createRequest("jellyvr_session=secret-1");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getBody().find("Pass:"), std::string::npos);
    EXPECT_NE(res.getBody().find("&lt;alice&gt;"), std::string::npos);
}

TEST_F(RootPageHandlerTest, ExpiredCookie_StartsNewLoginSupersedingOld)
{
    EXPECT_CALL(*mockAuthService_, pollLogin("old"))
        .WillOnce(Return(status(LoginStatus::State::EXPIRED)));
    EXPECT_CALL(*mockAuthService_, startLogin(Eq(std::optional<std::string>("old"))))
        .WillOnce(Return(domain::QuickConnectRequest("new", "NEW222")));

    auto req = createRequest("jellyvr_session=old");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_NE(res.getBody().find("NEW222"), std::string::npos);
    EXPECT_EQ(res.getHeader("Set-Cookie").value_or("").rfind("jellyvr_session=new;", 0), 0u);
}

TEST_F(RootPageHandlerTest, ActiveWithoutPassword_OffersRelogin)
{
    auto active = status(LoginStatus::State::ACTIVE);
    active.identity = domain::SessionIdentity{"sess-1", "user-1", "alice"};
    EXPECT_CALL(*mockAuthService_, pollLogin("secret-1")).WillOnce(Return(active));

    auto req = createRequest("jellyvr_session=secret-1");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_NE(res.getBody().find("href=\"/relogin\""), std::string::npos);
}

TEST_F(RootPageHandlerTest, Relogin_StartsNewLoginWithoutPolling)
{
    EXPECT_CALL(*mockAuthService_, pollLogin(_)).Times(0);
    EXPECT_CALL(*mockAuthService_, startLogin(Eq(std::optional<std::string>("secret-1"))))
        .WillOnce(Return(domain::QuickConnectRequest("secret-2", "NEW333")));

    auto req = createRequest("jellyvr_session=secret-1", "/relogin");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.getBody().find("NEW333"), std::string::npos);
    EXPECT_EQ(res.getHeader("Set-Cookie").value_or("").rfind("jellyvr_session=secret-2;", 0), 0u);
    // Обновление страницы возвращает на /, а не начинает ещё один логин
    EXPECT_NE(res.getBody().find("content=\"5;url=/\""), std::string::npos);
}

TEST_F(RootPageHandlerTest, JellyfinDown_Returns503WithRetryAfter)
{
    EXPECT_CALL(*mockAuthService_, startLogin(_))
        .WillOnce(Invoke([](const std::optional<std::string> &) -> domain::QuickConnectRequest
                         { throw domain::UpstreamUnavailableError("connection refused"); }));

    auto req = createRequest();
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_EQ(res.getHeader("Retry-After").value_or(""), "5");
}

TEST_F(RootPageHandlerTest, PostMethod_Returns405)
{
    auto req = createRequest();
    req.setMethod("POST");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
