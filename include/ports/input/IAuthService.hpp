#pragma once

#include "domain/Session.hpp"
#include "domain/QuickConnectRequest.hpp"
#include <string>
#include <optional>

namespace jellyvr::ports::input {

/**
 * @brief Результат опроса логина
 */
struct LoginStatus {
    enum class State {
        PENDING,    ///< Ждём подтверждения кода в Jellyfin
        ACTIVE,     ///< Сессия создана
        EXPIRED,    ///< Окно истекло, нужно начать заново
        UNKNOWN     ///< Такого secret нет в хранилище
    };

    State state = State::UNKNOWN;
    std::string displayCode;
    std::optional<domain::SessionIdentity> identity;
    /// Пароль в открытом виде: только у того вызова, который создал сессию
    std::optional<std::string> oneTimePassword;
};

/**
 * @brief Менеджер QuickConnect и локальных сессий
 */
class IAuthService {
public:
    virtual ~IAuthService() = default;

    /**
     * @brief Начать новый QuickConnect
     * @param previousSecret Предыдущий PENDING запрос этого браузера будет вытеснен
     * @throws domain::UpstreamUnavailableError, domain::StoreUnavailableError
     */
    virtual domain::QuickConnectRequest startLogin(
        const std::optional<std::string>& previousSecret = std::nullopt
    ) = 0;

    /**
     * @brief Опросить состояние логина (идемпотентно)
     *
     * Параллельные вызовы с одним secret создают ровно одну сессию.
     */
    virtual LoginStatus pollLogin(const std::string& secret) = 0;

    /**
     * @brief Проверить локальные логин/пароль (форма логина HereSphere)
     */
    virtual std::optional<domain::Session> authenticateLocal(
        const std::string& username,
        const std::string& password
    ) = 0;

    virtual std::optional<domain::Session> findSession(const std::string& sessionId) = 0;

    /**
     * @brief Признать сессию невалидной (Jellyfin ответил 401 на её токен)
     *
     * Запись сессии удаляется: локальный логин перестаёт работать,
     * а опрос QuickConnect, выдавшего её, возвращает EXPIRED.
     * @return false если сессии уже нет
     */
    virtual bool invalidateSession(const std::string& sessionId) = 0;
};

} // namespace jellyvr::ports::input
