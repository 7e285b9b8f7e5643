#pragma once

#include "domain/Session.hpp"
#include "domain/QuickConnectRequest.hpp"
#include "domain/PlaybackState.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace jellyvr::application::records {

// ============================================
// КЛЮЧИ
// ============================================

inline std::string sessionKey(const std::string& sessionId) {
    return "session:" + sessionId;
}

inline std::string usernameKey(const std::string& username) {
    return "username:" + username;
}

inline std::string quickConnectKey(const std::string& secret) {
    return "quickconnect:" + secret;
}

inline std::string playbackKey(const std::string& sessionId, const std::string& itemId) {
    return "playback:" + sessionId + ":" + itemId;
}

// ============================================
// ВРЕМЯ (мс от эпохи)
// ============================================

inline int64_t toMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// ============================================
// КОДЕКИ
// ============================================
// Сериализация детерминирована (поля в фиксированном порядке nlohmann::json),
// поэтому байты записи пригодны как expected для compareAndSwap.

inline std::string encode(const domain::Session& s) {
    nlohmann::json j;
    j["session_id"] = s.sessionId;
    j["jellyfin_user_id"] = s.jellyfinUserId;
    j["access_token"] = s.accessToken;
    j["local_username"] = s.localUsername;
    j["password_hash"] = s.passwordHash;
    j["password_salt"] = s.passwordSalt;
    j["created_at"] = toMillis(s.createdAt);
    j["last_used_at"] = toMillis(s.lastUsedAt);
    return j.dump();
}

inline std::string encode(const domain::QuickConnectRequest& r) {
    nlohmann::json j;
    j["secret"] = r.secret;
    j["display_code"] = r.displayCode;
    j["status"] = domain::toString(r.status);
    j["session_id"] = r.sessionId;
    j["superseded_by"] = r.supersededBy;
    j["created_at"] = toMillis(r.createdAt);
    j["updated_at"] = toMillis(r.updatedAt);
    return j.dump();
}

inline std::string encode(const domain::PlaybackState& p) {
    nlohmann::json j;
    j["session_id"] = p.sessionId;
    j["item_id"] = p.itemId;
    j["position_ticks"] = p.positionTicks;
    j["watched"] = p.watched;
    j["last_event"] = domain::toString(p.lastEvent);
    j["play_session_id"] = p.playSessionId;
    j["media_source_id"] = p.mediaSourceId;
    j["last_reported_at"] = toMillis(p.lastReportedAt);
    return j.dump();
}

inline std::string encodeUsernameIndex(const std::string& sessionId) {
    return nlohmann::json{{"session_id", sessionId}}.dump();
}

/**
 * @brief Разбор записей
 * @throws domain::StoreUnavailableError если запись повреждена
 */
inline domain::Session decodeSession(const std::string& raw) {
    try {
        auto j = nlohmann::json::parse(raw);
        domain::Session s;
        s.sessionId = j.at("session_id").get<std::string>();
        s.jellyfinUserId = j.at("jellyfin_user_id").get<std::string>();
        s.accessToken = j.at("access_token").get<std::string>();
        s.localUsername = j.at("local_username").get<std::string>();
        s.passwordHash = j.value("password_hash", "");
        s.passwordSalt = j.value("password_salt", "");
        s.createdAt = fromMillis(j.value("created_at", int64_t{0}));
        s.lastUsedAt = fromMillis(j.value("last_used_at", int64_t{0}));
        return s;
    } catch (const nlohmann::json::exception& e) {
        throw domain::StoreUnavailableError(std::string("corrupted session record: ") + e.what());
    }
}

inline domain::QuickConnectRequest decodeQuickConnect(const std::string& raw) {
    try {
        auto j = nlohmann::json::parse(raw);
        domain::QuickConnectRequest r;
        r.secret = j.at("secret").get<std::string>();
        r.displayCode = j.value("display_code", "");
        r.status = domain::parseQuickConnectStatus(j.at("status").get<std::string>());
        r.sessionId = j.value("session_id", "");
        r.supersededBy = j.value("superseded_by", "");
        r.createdAt = fromMillis(j.value("created_at", int64_t{0}));
        r.updatedAt = fromMillis(j.value("updated_at", int64_t{0}));
        return r;
    } catch (const nlohmann::json::exception& e) {
        throw domain::StoreUnavailableError(std::string("corrupted quickconnect record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::StoreUnavailableError(std::string("corrupted quickconnect record: ") + e.what());
    }
}

inline domain::PlaybackState decodePlaybackState(const std::string& raw) {
    try {
        auto j = nlohmann::json::parse(raw);
        domain::PlaybackState p;
        p.sessionId = j.at("session_id").get<std::string>();
        p.itemId = j.at("item_id").get<std::string>();
        p.positionTicks = j.value("position_ticks", int64_t{0});
        p.watched = j.value("watched", false);
        p.lastEvent = domain::parsePlaybackEventKind(j.value("last_event", "PROGRESS"));
        p.playSessionId = j.value("play_session_id", "");
        p.mediaSourceId = j.value("media_source_id", "");
        p.lastReportedAt = fromMillis(j.value("last_reported_at", int64_t{0}));
        return p;
    } catch (const nlohmann::json::exception& e) {
        throw domain::StoreUnavailableError(std::string("corrupted playback record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::StoreUnavailableError(std::string("corrupted playback record: ") + e.what());
    }
}

inline std::string decodeUsernameIndex(const std::string& raw) {
    try {
        return nlohmann::json::parse(raw).at("session_id").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw domain::StoreUnavailableError(std::string("corrupted username index: ") + e.what());
    }
}

} // namespace jellyvr::application::records
