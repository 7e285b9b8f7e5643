#include <gtest/gtest.h>

#include "application/RecordCodec.hpp"

using namespace jellyvr;
namespace records = jellyvr::application::records;

TEST(RecordCodecTest, Keys_HaveDistinctPrefixes) {
    EXPECT_EQ(records::sessionKey("s"), "session:s");
    EXPECT_EQ(records::usernameKey("alice"), "username:alice");
    EXPECT_EQ(records::quickConnectKey("q"), "quickconnect:q");
    EXPECT_EQ(records::playbackKey("s", "i"), "playback:s:i");
}

TEST(RecordCodecTest, Encode_SameRecord_SameBytes) {
    domain::QuickConnectRequest request("secret", "ABC123");
    EXPECT_EQ(records::encode(request), records::encode(request));
}

TEST(RecordCodecTest, DecodeSession_KeepsMillisecondTimestamps) {
    domain::Session session("sess-1", "user-1", "tok", "alice");
    session.createdAt = records::fromMillis(1700000000123);

    auto decoded = records::decodeSession(records::encode(session));

    EXPECT_EQ(records::toMillis(decoded.createdAt), 1700000000123);
    EXPECT_EQ(decoded.localUsername, "alice");
}

TEST(RecordCodecTest, Decode_CorruptedRecord_ThrowsStoreUnavailable) {
    EXPECT_THROW(records::decodeSession("not json"), domain::StoreUnavailableError);
    EXPECT_THROW(records::decodeQuickConnect(R"({"secret":"s","status":"BOGUS"})"),
                 domain::StoreUnavailableError);
    EXPECT_THROW(records::decodePlaybackState(R"({"item_id":"i"})"), domain::StoreUnavailableError);
    EXPECT_THROW(records::decodeUsernameIndex("[]"), domain::StoreUnavailableError);
}
