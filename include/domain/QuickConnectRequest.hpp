#pragma once

#include "domain/enums/QuickConnectStatus.hpp"
#include <string>
#include <chrono>

namespace jellyvr::domain {

/**
 * @brief Попытка авторизации устройства через QuickConnect
 *
 * Ключ в хранилище - secret. Вытесненные запросы не удаляются,
 * а переводятся в EXPIRED с заполненным supersededBy.
 */
struct QuickConnectRequest {
    std::string secret;             ///< Для опроса Jellyfin
    std::string displayCode;        ///< Код, который вводит пользователь
    QuickConnectStatus status = QuickConnectStatus::PENDING;
    std::string sessionId;          ///< Заполнен в AUTHORIZED
    std::string supersededBy;       ///< secret более нового запроса
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;

    QuickConnectRequest() = default;

    QuickConnectRequest(const std::string& secret, const std::string& displayCode)
        : secret(secret)
        , displayCode(displayCode)
        , createdAt(std::chrono::system_clock::now())
        , updatedAt(createdAt)
    {}

    bool isExpiredAt(std::chrono::system_clock::time_point now,
                     std::chrono::seconds window) const {
        return now - createdAt > window;
    }
};

} // namespace jellyvr::domain
