/**
 * @file CachedJellyfinGatewayTest.cpp
 * @brief Unit-тесты кэша метаданных Jellyfin
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/CachedJellyfinGateway.hpp"
#include "domain/Errors.hpp"
#include "mocks/MockJellyfinGateway.hpp"
#include "mocks/TestSettings.hpp"

#include <chrono>
#include <thread>

using namespace jellyvr;
using namespace jellyvr::adapters::secondary;
using namespace jellyvr::tests::mocks;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class CachedJellyfinGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockGateway_ = std::make_shared<MockJellyfinGateway>();
        cacheSettings_ = std::make_shared<TestCacheSettings>();
        jellyfinSettings_ = std::make_shared<TestJellyfinSettings>();
        jellyfinSettings_->pageSize = 2;
    }

    std::shared_ptr<CachedJellyfinGateway> createGateway() {
        return std::make_shared<CachedJellyfinGateway>(mockGateway_, cacheSettings_, jellyfinSettings_);
    }

    static domain::MediaItem makeItem(const std::string& id) {
        domain::MediaItem item;
        item.id = id;
        item.name = "Video " + id;
        item.type = "Movie";
        item.locationType = "FileSystem";
        return item;
    }

    static ports::output::LibraryPage makePage(std::vector<std::string> ids, int total) {
        ports::output::LibraryPage page;
        for (const auto& id : ids) {
            page.items.push_back(makeItem(id));
        }
        page.totalRecordCount = total;
        page.rawCount = static_cast<int>(ids.size());
        return page;
    }

    std::shared_ptr<MockJellyfinGateway> mockGateway_;
    std::shared_ptr<TestCacheSettings> cacheSettings_;
    std::shared_ptr<TestJellyfinSettings> jellyfinSettings_;

    const domain::JellyfinCredentials alice_{"user-alice", "token-a"};
    const domain::JellyfinCredentials bob_{"user-bob", "token-b"};
};

// ============================================================================
// БИБЛИОТЕКА
// ============================================================================

TEST_F(CachedJellyfinGatewayTest, FetchLibraryPage_SecondCall_ServedFromCache) {
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .Times(1)
        .WillOnce(Return(makePage({"a", "b"}, 2)));

    auto gateway = createGateway();
    auto first = gateway->fetchLibraryPage(alice_, 0, 2);
    auto second = gateway->fetchLibraryPage(alice_, 0, 2);

    ASSERT_EQ(second.items.size(), 2u);
    EXPECT_EQ(second.items[1].id, "b");
    EXPECT_EQ(second.totalRecordCount, first.totalRecordCount);
    EXPECT_EQ(gateway->getPageCacheSize(), 1u);
}

TEST_F(CachedJellyfinGatewayTest, FetchLibraryPage_OtherUser_NotShared) {
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .Times(2)
        .WillRepeatedly([](const domain::JellyfinCredentials& credentials, int, int) {
            return makePage({credentials.userId + "-video"}, 1);
        });

    auto gateway = createGateway();
    auto forAlice = gateway->fetchLibraryPage(alice_, 0, 2);
    auto forBob = gateway->fetchLibraryPage(bob_, 0, 2);

    EXPECT_EQ(forAlice.items[0].id, "user-alice-video");
    EXPECT_EQ(forBob.items[0].id, "user-bob-video");
}

TEST_F(CachedJellyfinGatewayTest, ListLibrary_WalksPagesThroughCache) {
    EXPECT_CALL(*mockGateway_, listLibrary(_)).Times(0);
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .Times(1)
        .WillOnce(Return(makePage({"a", "b"}, 3)));
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 2, 2))
        .Times(1)
        .WillOnce(Return(makePage({"c"}, 3)));

    auto gateway = createGateway();
    for (int pass = 0; pass < 2; ++pass) {
        auto cursor = gateway->listLibrary(alice_);
        std::vector<std::string> ids;
        while (auto page = cursor.next()) {
            for (const auto& item : *page) {
                ids.push_back(item.id);
            }
        }
        EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "c"}));
    }
}

TEST_F(CachedJellyfinGatewayTest, FetchLibraryPage_Error_NotCached) {
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .WillOnce(Throw(domain::UpstreamUnavailableError("Jellyfin returned 503")))
        .WillOnce(Return(makePage({"a"}, 1)));

    auto gateway = createGateway();
    EXPECT_THROW(gateway->fetchLibraryPage(alice_, 0, 2), domain::UpstreamUnavailableError);

    auto page = gateway->fetchLibraryPage(alice_, 0, 2);
    EXPECT_EQ(page.items.size(), 1u);
}

// ============================================================================
// КАРТОЧКИ
// ============================================================================

TEST_F(CachedJellyfinGatewayTest, GetItem_AfterPage_ServedFromWarmCache) {
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .WillOnce(Return(makePage({"a", "b"}, 2)));
    EXPECT_CALL(*mockGateway_, getItem(_, _)).Times(0);

    auto gateway = createGateway();
    gateway->fetchLibraryPage(alice_, 0, 2);

    auto item = gateway->getItem(alice_, "b");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->name, "Video b");
    EXPECT_EQ(gateway->getItemCacheSize(), 2u);
}

TEST_F(CachedJellyfinGatewayTest, GetItem_WarmCache_NotVisibleToOtherUser) {
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .WillOnce(Return(makePage({"a"}, 1)));
    EXPECT_CALL(*mockGateway_, getItem(_, "a"))
        .Times(1)
        .WillOnce(Return(std::nullopt));

    auto gateway = createGateway();
    gateway->fetchLibraryPage(alice_, 0, 2);

    EXPECT_FALSE(gateway->getItem(bob_, "a").has_value());
}

TEST_F(CachedJellyfinGatewayTest, GetItem_NotFound_NotCached) {
    EXPECT_CALL(*mockGateway_, getItem(_, "new"))
        .WillOnce(Return(std::nullopt))
        .WillOnce(Return(makeItem("new")));

    auto gateway = createGateway();
    EXPECT_FALSE(gateway->getItem(alice_, "new").has_value());

    auto item = gateway->getItem(alice_, "new");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->id, "new");
}

TEST_F(CachedJellyfinGatewayTest, GetItem_AuthExpired_Propagates) {
    EXPECT_CALL(*mockGateway_, getItem(_, "a"))
        .WillOnce(Throw(domain::AuthExpiredError("token revoked")));

    auto gateway = createGateway();
    EXPECT_THROW(gateway->getItem(alice_, "a"), domain::AuthExpiredError);
    EXPECT_EQ(gateway->getItemCacheSize(), 0u);
}

// ============================================================================
// TTL
// ============================================================================

TEST_F(CachedJellyfinGatewayTest, GetItem_AfterTtl_FetchedAgain) {
    cacheSettings_->ttlSeconds = 1;
    EXPECT_CALL(*mockGateway_, getItem(_, "a"))
        .Times(2)
        .WillRepeatedly(Return(makeItem("a")));

    auto gateway = createGateway();
    gateway->getItem(alice_, "a");
    gateway->getItem(alice_, "a");

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    gateway->getItem(alice_, "a");
}

TEST_F(CachedJellyfinGatewayTest, ZeroTtl_EveryCallGoesUpstream) {
    cacheSettings_->ttlSeconds = 0;
    EXPECT_CALL(*mockGateway_, fetchLibraryPage(_, 0, 2))
        .Times(2)
        .WillRepeatedly(Return(makePage({"a"}, 1)));
    EXPECT_CALL(*mockGateway_, getItem(_, "a"))
        .Times(1)
        .WillOnce(Return(makeItem("a")));

    auto gateway = createGateway();
    gateway->fetchLibraryPage(alice_, 0, 2);
    gateway->fetchLibraryPage(alice_, 0, 2);
    gateway->getItem(alice_, "a");

    EXPECT_EQ(gateway->getPageCacheSize(), 0u);
    EXPECT_EQ(gateway->getItemCacheSize(), 0u);
}

TEST_F(CachedJellyfinGatewayTest, ClearAllCaches_NextCallGoesUpstream) {
    EXPECT_CALL(*mockGateway_, getItem(_, "a"))
        .Times(2)
        .WillRepeatedly(Return(makeItem("a")));

    auto gateway = createGateway();
    gateway->getItem(alice_, "a");
    gateway->clearAllCaches();
    gateway->getItem(alice_, "a");
}

// ============================================================================
// ВОСПРОИЗВЕДЕНИЕ
// ============================================================================

TEST_F(CachedJellyfinGatewayTest, PlaybackCalls_AlwaysDelegated) {
    domain::PlaybackInfo info;
    info.playSessionId = "ps-1";
    info.mediaSourceId = "ms-1";

    EXPECT_CALL(*mockGateway_, getPlaybackInfo(_, "a"))
        .Times(2)
        .WillRepeatedly(Return(info));
    EXPECT_CALL(*mockGateway_, reportPlaybackStart(_, "a", "ps-1", "ms-1")).Times(2);
    EXPECT_CALL(*mockGateway_, rewriteMediaUrl("/Videos/a/stream"))
        .WillOnce(Return("http://jellyfin:8096/Videos/a/stream"));

    auto gateway = createGateway();
    for (int i = 0; i < 2; ++i) {
        auto playback = gateway->getPlaybackInfo(alice_, "a");
        gateway->reportPlaybackStart(alice_, "a", playback.playSessionId, playback.mediaSourceId);
    }
    EXPECT_EQ(gateway->rewriteMediaUrl("/Videos/a/stream"), "http://jellyfin:8096/Videos/a/stream");
}
