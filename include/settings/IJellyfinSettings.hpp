#pragma once

#include <string>

namespace jellyvr::settings {

/**
 * @brief Параметры подключения к Jellyfin
 */
class IJellyfinSettings {
public:
    virtual ~IJellyfinSettings() = default;

    /// Внутренний адрес, через который шлюз ходит в API
    virtual std::string getHost() const = 0;

    /// Внешний адрес для ссылок на медиа и картинки; пусто - совпадает с getHost()
    virtual std::string getRemoteHost() const = 0;

    virtual int getRequestTimeoutMs() const = 0;
    virtual int getPollTimeoutMs() const = 0;
    virtual int getPageSize() const = 0;
    virtual std::string getDeviceId() const = 0;

    /// Потоки для запросов с таймаутом
    virtual int getMaxConcurrentRequests() const = 0;
    /// Сколько запросов может ждать свободный поток; сверх этого UpstreamUnavailableError
    virtual int getMaxQueuedRequests() const = 0;
};

} // namespace jellyvr::settings
