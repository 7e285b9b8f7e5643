#pragma once

#include <gmock/gmock.h>
#include "ports/output/IJellyfinGateway.hpp"

namespace jellyvr::tests::mocks {

class MockJellyfinGateway : public ports::output::IJellyfinGateway {
public:
    MOCK_METHOD(ports::output::QuickConnectTicket, quickConnectInitiate, (), (override));
    MOCK_METHOD(ports::output::QuickConnectPollResult, quickConnectPoll,
                (const std::string& secret), (override));
    MOCK_METHOD(ports::output::LibraryCursor, listLibrary,
                (const domain::JellyfinCredentials& credentials), (override));
    MOCK_METHOD(ports::output::LibraryPage, fetchLibraryPage,
                (const domain::JellyfinCredentials& credentials, int startIndex, int limit), (override));
    MOCK_METHOD(std::optional<domain::MediaItem>, getItem,
                (const domain::JellyfinCredentials& credentials, const std::string& itemId), (override));
    MOCK_METHOD(domain::PlaybackInfo, getPlaybackInfo,
                (const domain::JellyfinCredentials& credentials, const std::string& itemId), (override));
    MOCK_METHOD(void, reportPlaybackStart,
                (const domain::JellyfinCredentials& credentials, const std::string& itemId,
                 const std::string& playSessionId, const std::string& mediaSourceId), (override));
    MOCK_METHOD(void, reportProgress,
                (const domain::JellyfinCredentials& credentials, const std::string& itemId,
                 int64_t positionTicks, domain::PlaybackEventKind kind,
                 const std::string& playSessionId), (override));
    MOCK_METHOD(std::string, rewriteMediaUrl, (const std::string& url), (const, override));
    MOCK_METHOD(std::string, baseUrl, (), (const, override));
};

} // namespace jellyvr::tests::mocks
