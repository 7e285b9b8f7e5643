#pragma once

#include "domain/MediaItem.hpp"
#include "domain/enums/PlaybackEventKind.hpp"
#include "ports/output/LibraryCursor.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace jellyvr::ports::output {

/**
 * @brief Ответ QuickConnect/Initiate
 */
struct QuickConnectTicket {
    std::string secret;
    std::string code;
};

/**
 * @brief Результат опроса QuickConnect
 */
struct QuickConnectPollResult {
    enum class State {
        PENDING,
        APPROVED,
        EXPIRED     ///< Jellyfin не знает secret (истёк или отклонён)
    };

    State state = State::PENDING;
    std::string userId;
    std::string userName;
    std::string accessToken;

    static QuickConnectPollResult pending() { return {}; }

    static QuickConnectPollResult expired() {
        QuickConnectPollResult r;
        r.state = State::EXPIRED;
        return r;
    }

    static QuickConnectPollResult approved(const std::string& userId,
                                           const std::string& userName,
                                           const std::string& accessToken) {
        QuickConnectPollResult r;
        r.state = State::APPROVED;
        r.userId = userId;
        r.userName = userName;
        r.accessToken = accessToken;
        return r;
    }
};

/**
 * @brief Клиент подмножества REST API Jellyfin
 *
 * Без состояния: токен передаётся в каждый вызов.
 * Повторов внутри нет, их делает вызывающий.
 *
 * Ошибки:
 * - 401 → domain::AuthExpiredError
 * - 5xx / таймаут / сеть → domain::UpstreamUnavailableError
 */
class IJellyfinGateway {
public:
    virtual ~IJellyfinGateway() = default;

    virtual QuickConnectTicket quickConnectInitiate() = 0;
    virtual QuickConnectPollResult quickConnectPoll(const std::string& secret) = 0;

    /**
     * @brief Ленивый постраничный обход библиотеки
     *
     * Один HTTP-запрос на страницу, при вызове LibraryCursor::next().
     */
    virtual LibraryCursor listLibrary(const domain::JellyfinCredentials& credentials) = 0;

    virtual LibraryPage fetchLibraryPage(
        const domain::JellyfinCredentials& credentials,
        int startIndex,
        int limit
    ) = 0;

    virtual std::optional<domain::MediaItem> getItem(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId
    ) = 0;

    virtual domain::PlaybackInfo getPlaybackInfo(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId
    ) = 0;

    virtual void reportPlaybackStart(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId,
        const std::string& playSessionId,
        const std::string& mediaSourceId
    ) = 0;

    virtual void reportProgress(
        const domain::JellyfinCredentials& credentials,
        const std::string& itemId,
        int64_t positionTicks,
        domain::PlaybackEventKind kind,
        const std::string& playSessionId
    ) = 0;

    /**
     * @brief Заменить внутренний хост Jellyfin на внешний
     */
    virtual std::string rewriteMediaUrl(const std::string& url) const = 0;

    /**
     * @brief Базовый URL, из которого строятся ссылки на медиа
     */
    virtual std::string baseUrl() const = 0;
};

} // namespace jellyvr::ports::output
