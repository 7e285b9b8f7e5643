#pragma once

#include <string>

namespace jellyvr::settings {

/**
 * @brief Поведенческие параметры шлюза
 */
class IGatewaySettings {
public:
    virtual ~IGatewaySettings() = default;

    /// Сколько живёт PENDING запрос QuickConnect
    virtual int getQuickConnectWindowSeconds() const = 0;
    virtual int getPasswordLength() const = 0;

    /// Повторы только для UpstreamUnavailable
    virtual int getUpstreamRetryAttempts() const = 0;
    virtual int getUpstreamRetryBackoffMs() const = 0;

    /// Пусто - отдавать все текстовые субтитры
    virtual std::string getSubtitlesLanguage() const = 0;

    /// Порог, после которого Close считается просмотром до конца
    virtual int getWatchedPercent() const = 0;

    virtual int getStoreCasAttempts() const = 0;
};

} // namespace jellyvr::settings
