#pragma once

#include <stdexcept>
#include <string>

namespace jellyvr::domain {

/**
 * @brief Базовое исключение шлюза
 *
 * Handlers ловят наследников и переводят в HTTP-ответ
 * без раскрытия внутренних деталей.
 */
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Хранилище недоступно или повреждено
 *
 * Фатально для текущего запроса (5xx). Вызывающий может повторить запрос.
 */
class StoreUnavailableError : public GatewayError {
public:
    explicit StoreUnavailableError(const std::string& message)
        : GatewayError("Store unavailable: " + message) {}
};

/**
 * @brief Jellyfin недоступен (5xx, таймаут, сетевая ошибка)
 */
class UpstreamUnavailableError : public GatewayError {
public:
    explicit UpstreamUnavailableError(const std::string& message)
        : GatewayError("Upstream unavailable: " + message) {}
};

/**
 * @brief Jellyfin отклонил access token (401)
 *
 * Сессия считается невалидной, пользователь должен пройти QuickConnect заново.
 */
class AuthExpiredError : public GatewayError {
public:
    explicit AuthExpiredError(const std::string& message)
        : GatewayError("Jellyfin token rejected: " + message) {}
};

} // namespace jellyvr::domain
