/**
 * @file SessionRevocationTest.cpp
 * @brief Jellyfin отзывает токен: HereSphere просит логин, корневая страница выдаёт новый код
 *
 * Настоящие AuthService и HereSphereService поверх InMemoryKeyValueStore.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/AuthService.hpp"
#include "application/HereSphereService.hpp"
#include "adapters/secondary/Sha256PasswordHasher.hpp"
#include "mocks/InMemoryKeyValueStore.hpp"
#include "mocks/MockJellyfinGateway.hpp"
#include "mocks/MockPlaybackTracker.hpp"
#include "mocks/TestSettings.hpp"

using namespace jellyvr;
using namespace jellyvr::tests::mocks;
using ports::input::LoginStatus;
using ports::output::QuickConnectPollResult;
using ::testing::_;
using ::testing::Return;
using ::testing::Invoke;
using ::testing::NiceMock;

class SessionRevocationTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryKeyValueStore>();
        jellyfin_ = std::make_shared<NiceMock<MockJellyfinGateway>>();
        tracker_ = std::make_shared<NiceMock<MockPlaybackTracker>>();
        settings_ = std::make_shared<TestGatewaySettings>();

        ON_CALL(*jellyfin_, baseUrl()).WillByDefault(Return("http://jellyfin:8096"));

        authService_ = std::make_shared<application::AuthService>(
            store_, jellyfin_, std::make_shared<adapters::secondary::Sha256PasswordHasher>(), settings_
        );
        hereSphere_ = std::make_shared<application::HereSphereService>(
            authService_, tracker_, jellyfin_, std::make_shared<TestJellyfinSettings>(), settings_
        );
    }

    LoginStatus approveLogin(const std::string& secret, const std::string& token) {
        EXPECT_CALL(*jellyfin_, quickConnectInitiate())
            .WillOnce(Return(ports::output::QuickConnectTicket{secret, "ABC123"}));
        authService_->startLogin();
        EXPECT_CALL(*jellyfin_, quickConnectPoll(secret))
            .WillOnce(Return(QuickConnectPollResult::approved("user-1", "alice", token)));
        return authService_->pollLogin(secret);
    }

    void tokenRejected() {
        EXPECT_CALL(*jellyfin_, listLibrary(_))
            .WillOnce(Invoke([](const domain::JellyfinCredentials&) -> ports::output::LibraryCursor {
                throw domain::AuthExpiredError("401");
            }));
    }

    static domain::heresphere::Request login(const std::string& password) {
        domain::heresphere::Request request;
        request.username = "alice";
        request.password = password;
        return request;
    }

    std::shared_ptr<InMemoryKeyValueStore> store_;
    std::shared_ptr<NiceMock<MockJellyfinGateway>> jellyfin_;
    std::shared_ptr<NiceMock<MockPlaybackTracker>> tracker_;
    std::shared_ptr<TestGatewaySettings> settings_;
    std::shared_ptr<application::AuthService> authService_;
    std::shared_ptr<application::HereSphereService> hereSphere_;
};

TEST_F(SessionRevocationTest, TokenRejected_IndexAsksLoginAndRootPageGetsExpired) {
    auto approved = approveLogin("s1", "token-1");
    ASSERT_TRUE(approved.oneTimePassword.has_value());

    tokenRejected();
    auto response = hereSphere_->index(login(*approved.oneTimePassword), "http://vr.local");

    EXPECT_EQ(response.body["access"], -1);
    // Корневая страница с тем же cookie получает EXPIRED и начинает новый QuickConnect
    EXPECT_EQ(authService_->pollLogin("s1").state, LoginStatus::State::EXPIRED);
    EXPECT_FALSE(authService_->authenticateLocal("alice", *approved.oneTimePassword).has_value());
}

TEST_F(SessionRevocationTest, TokenRejected_FreshQuickConnectRestoresAccess) {
    auto first = approveLogin("s1", "token-1");
    tokenRejected();
    hereSphere_->index(login(*first.oneTimePassword), "http://vr.local");

    auto second = approveLogin("s2", "token-2");
    ASSERT_EQ(second.state, LoginStatus::State::ACTIVE);
    ASSERT_TRUE(second.oneTimePassword.has_value());

    EXPECT_CALL(*jellyfin_, listLibrary(_))
        .WillOnce(Invoke([](const domain::JellyfinCredentials& credentials) {
            EXPECT_EQ(credentials.accessToken, "token-2");
            return ports::output::LibraryCursor([](int, int) { return ports::output::LibraryPage{}; }, 100);
        }));
    auto response = hereSphere_->index(login(*second.oneTimePassword), "http://vr.local");

    EXPECT_EQ(response.body["access"], 1);
}
