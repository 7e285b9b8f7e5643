#pragma once

#include <string>
#include <chrono>

namespace jellyvr::domain {

/**
 * @brief Локальная сессия, привязанная к аккаунту Jellyfin
 *
 * Создаётся после подтверждения QuickConnect. Не истекает сама:
 * единственный сигнал истечения - 401 от Jellyfin.
 * После выдачи меняются только lastUsedAt и accessToken.
 */
struct Session {
    std::string sessionId;          ///< Формат: "sess-xxxxxxxx-..."
    std::string jellyfinUserId;     ///< ID пользователя в Jellyfin
    std::string accessToken;        ///< Токен, выданный Jellyfin
    std::string localUsername;      ///< Совпадает с именем пользователя Jellyfin
    std::string passwordHash;       ///< hex(SHA-256(salt + password))
    std::string passwordSalt;       ///< hex соль
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastUsedAt;

    Session() = default;

    Session(const std::string& sessionId,
            const std::string& jellyfinUserId,
            const std::string& accessToken,
            const std::string& localUsername)
        : sessionId(sessionId)
        , jellyfinUserId(jellyfinUserId)
        , accessToken(accessToken)
        , localUsername(localUsername)
        , createdAt(std::chrono::system_clock::now())
        , lastUsedAt(createdAt)
    {}
};

/**
 * @brief Публичная часть сессии (без секретов)
 */
struct SessionIdentity {
    std::string sessionId;
    std::string jellyfinUserId;
    std::string localUsername;

    bool operator==(const SessionIdentity& other) const {
        return sessionId == other.sessionId
            && jellyfinUserId == other.jellyfinUserId
            && localUsername == other.localUsername;
    }
};

inline SessionIdentity identityOf(const Session& session) {
    return {session.sessionId, session.jellyfinUserId, session.localUsername};
}

} // namespace jellyvr::domain
