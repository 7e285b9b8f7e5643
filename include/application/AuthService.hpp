#pragma once

#include "ports/input/IAuthService.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/IJellyfinGateway.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "settings/IGatewaySettings.hpp"
#include "application/RecordCodec.hpp"
#include "application/Retry.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <memory>
#include <iostream>

namespace jellyvr::application {

/**
 * @brief Менеджер QuickConnect и локальных сессий
 *
 * Всё состояние живёт в хранилище, сервис без состояния.
 * Переход PENDING → AUTHORIZED делается одним compareAndSwap по байтам
 * PENDING записи, поэтому при параллельных опросах побеждает один вызов,
 * а поздний APPROVED после EXPIRED ничего не авторизует.
 */
class AuthService : public ports::input::IAuthService {
public:
    AuthService(
        std::shared_ptr<ports::output::IKeyValueStore> store,
        std::shared_ptr<ports::output::IJellyfinGateway> jellyfin,
        std::shared_ptr<ports::output::IPasswordHasher> hasher,
        std::shared_ptr<settings::IGatewaySettings> settings
    ) : store_(std::move(store))
      , jellyfin_(std::move(jellyfin))
      , hasher_(std::move(hasher))
      , settings_(std::move(settings))
    {
        std::cout << "[AuthService] Created" << std::endl;
    }

    domain::QuickConnectRequest startLogin(
        const std::optional<std::string>& previousSecret = std::nullopt
    ) override {
        auto ticket = withUpstreamRetry(
            "quickConnectInitiate", settings_->getUpstreamRetryAttempts(), retryBackoff(),
            [this]() { return jellyfin_->quickConnectInitiate(); });

        domain::QuickConnectRequest request(ticket.secret, ticket.code);
        store_->put(records::quickConnectKey(request.secret), records::encode(request));
        std::cout << "[AuthService] QuickConnect started, code " << request.displayCode << std::endl;

        if (previousSecret && !previousSecret->empty() && *previousSecret != request.secret) {
            supersede(*previousSecret, request.secret);
        }

        return request;
    }

    ports::input::LoginStatus pollLogin(const std::string& secret) override {
        const std::string key = records::quickConnectKey(secret);

        for (int attempt = 0; attempt < casAttempts(); ++attempt) {
            auto raw = store_->get(key);
            if (!raw) {
                return {};
            }

            auto request = records::decodeQuickConnect(*raw);

            if (request.status == domain::QuickConnectStatus::EXPIRED) {
                return expiredStatus(request);
            }
            if (request.status == domain::QuickConnectStatus::AUTHORIZED) {
                return resolveAuthorized(request);
            }

            // PENDING: сначала локальное окно, потом Jellyfin
            auto now = std::chrono::system_clock::now();
            if (request.isExpiredAt(now, std::chrono::seconds(settings_->getQuickConnectWindowSeconds()))) {
                if (expire(key, *raw, request) == ports::output::CasResult::SWAPPED) {
                    std::cout << "[AuthService] QuickConnect " << request.displayCode
                              << " expired locally" << std::endl;
                    return expiredStatus(request);
                }
                continue;
            }

            auto poll = withUpstreamRetry(
                "quickConnectPoll", settings_->getUpstreamRetryAttempts(), retryBackoff(),
                [this, &secret]() { return jellyfin_->quickConnectPoll(secret); });

            switch (poll.state) {
                case ports::output::QuickConnectPollResult::State::PENDING: {
                    ports::input::LoginStatus status;
                    status.state = ports::input::LoginStatus::State::PENDING;
                    status.displayCode = request.displayCode;
                    return status;
                }

                case ports::output::QuickConnectPollResult::State::EXPIRED:
                    if (expire(key, *raw, request) == ports::output::CasResult::SWAPPED) {
                        std::cout << "[AuthService] QuickConnect " << request.displayCode
                                  << " rejected by Jellyfin" << std::endl;
                        return expiredStatus(request);
                    }
                    continue;

                case ports::output::QuickConnectPollResult::State::APPROVED: {
                    auto status = authorize(key, *raw, request, poll);
                    if (status) {
                        return *status;
                    }
                    // Проиграли гонку: перечитываем запись победителя
                    continue;
                }
            }
        }

        throw domain::StoreUnavailableError("too much contention on quickconnect record");
    }

    std::optional<domain::Session> authenticateLocal(
        const std::string& username,
        const std::string& password
    ) override {
        if (username.empty() || password.empty()) {
            return std::nullopt;
        }

        auto index = store_->get(records::usernameKey(username));
        if (!index) {
            return std::nullopt;
        }

        const std::string sessionKey = records::sessionKey(records::decodeUsernameIndex(*index));
        auto raw = store_->get(sessionKey);
        if (!raw) {
            return std::nullopt;
        }

        auto session = records::decodeSession(*raw);
        if (!hasher_->verify(password, session.passwordSalt, session.passwordHash)) {
            return std::nullopt;
        }

        // lastUsedAt обновляется по возможности, конфликт не ошибка
        auto touched = session;
        touched.lastUsedAt = std::chrono::system_clock::now();
        if (store_->compareAndSwap(sessionKey, *raw, records::encode(touched)) ==
            ports::output::CasResult::SWAPPED) {
            return touched;
        }
        return session;
    }

    std::optional<domain::Session> findSession(const std::string& sessionId) override {
        if (sessionId.empty()) {
            return std::nullopt;
        }
        auto raw = store_->get(records::sessionKey(sessionId));
        if (!raw) {
            return std::nullopt;
        }
        return records::decodeSession(*raw);
    }

    bool invalidateSession(const std::string& sessionId) override {
        if (sessionId.empty()) {
            return false;
        }
        // Индекс username не трогаем: без записи сессии он ни на что не указывает,
        // следующий логин пользователя перепишет его в claimUsername
        bool removed = store_->remove(records::sessionKey(sessionId));
        if (removed) {
            std::cout << "[AuthService] Session " << sessionId
                      << " invalidated, QuickConnect required" << std::endl;
        }
        return removed;
    }

private:
    std::shared_ptr<ports::output::IKeyValueStore> store_;
    std::shared_ptr<ports::output::IJellyfinGateway> jellyfin_;
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
    std::shared_ptr<settings::IGatewaySettings> settings_;

    int casAttempts() const {
        return std::max(1, settings_->getStoreCasAttempts());
    }

    std::chrono::milliseconds retryBackoff() const {
        return std::chrono::milliseconds(settings_->getUpstreamRetryBackoffMs());
    }

    static ports::input::LoginStatus expiredStatus(const domain::QuickConnectRequest& request) {
        ports::input::LoginStatus status;
        status.state = ports::input::LoginStatus::State::EXPIRED;
        status.displayCode = request.displayCode;
        return status;
    }

    ports::output::CasResult expire(const std::string& key,
                                     const std::string& raw,
                                     const domain::QuickConnectRequest& request) {
        auto expired = request;
        expired.status = domain::QuickConnectStatus::EXPIRED;
        expired.updatedAt = std::chrono::system_clock::now();
        return store_->compareAndSwap(key, raw, records::encode(expired));
    }

    void supersede(const std::string& previousSecret, const std::string& newSecret) {
        const std::string key = records::quickConnectKey(previousSecret);

        for (int attempt = 0; attempt < casAttempts(); ++attempt) {
            auto raw = store_->get(key);
            if (!raw) {
                return;
            }
            auto previous = records::decodeQuickConnect(*raw);
            if (domain::isTerminal(previous.status)) {
                return;
            }

            previous.status = domain::QuickConnectStatus::EXPIRED;
            previous.supersededBy = newSecret;
            previous.updatedAt = std::chrono::system_clock::now();
            if (store_->compareAndSwap(key, *raw, records::encode(previous)) ==
                ports::output::CasResult::SWAPPED) {
                std::cout << "[AuthService] QuickConnect " << previous.displayCode
                          << " superseded" << std::endl;
                return;
            }
        }

        throw domain::StoreUnavailableError("too much contention on quickconnect record");
    }

    /**
     * @brief Создать сессию и закрепить её за запросом
     * @return std::nullopt если запрос уже перевёл другой вызов
     */
    std::optional<ports::input::LoginStatus> authorize(
        const std::string& key,
        const std::string& raw,
        const domain::QuickConnectRequest& request,
        const ports::output::QuickConnectPollResult& poll
    ) {
        domain::Session session(utils::IdGenerator::sessionId(),
                                poll.userId, poll.accessToken, poll.userName);
        std::string password = hasher_->generatePassword(settings_->getPasswordLength());
        session.passwordSalt = hasher_->generateSalt();
        session.passwordHash = hasher_->hash(password, session.passwordSalt);

        const std::string sessionKey = records::sessionKey(session.sessionId);
        store_->put(sessionKey, records::encode(session));

        auto authorized = request;
        authorized.status = domain::QuickConnectStatus::AUTHORIZED;
        authorized.sessionId = session.sessionId;
        authorized.updatedAt = std::chrono::system_clock::now();

        if (store_->compareAndSwap(key, raw, records::encode(authorized)) ==
            ports::output::CasResult::CONFLICT) {
            store_->remove(sessionKey);
            return std::nullopt;
        }

        std::cout << "[AuthService] Session created for " << session.localUsername << std::endl;

        // Индекс чинится при следующем опросе, пароль отдаём в любом случае
        try {
            claimUsername(session);
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[AuthService] Username index not updated: " << e.what() << std::endl;
        }

        ports::input::LoginStatus status;
        status.state = ports::input::LoginStatus::State::ACTIVE;
        status.displayCode = request.displayCode;
        status.identity = domain::identityOf(session);
        status.oneTimePassword = password;
        return status;
    }

    ports::input::LoginStatus resolveAuthorized(const domain::QuickConnectRequest& request) {
        auto session = findSession(request.sessionId);
        if (!session) {
            // Сессию вытеснил более новый логин или её отозвал Jellyfin
            return expiredStatus(request);
        }

        claimUsername(*session);

        ports::input::LoginStatus status;
        status.state = ports::input::LoginStatus::State::ACTIVE;
        status.displayCode = request.displayCode;
        status.identity = domain::identityOf(*session);
        return status;
    }

    static bool isNewer(const domain::Session& a, const domain::Session& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.sessionId > b.sessionId;
    }

    /**
     * @brief Направить username индекс на сессию, если она новее текущей
     *
     * Вытесненная сессия того же пользователя удаляется.
     */
    void claimUsername(const domain::Session& session) {
        const std::string key = records::usernameKey(session.localUsername);
        const std::string desired = records::encodeUsernameIndex(session.sessionId);

        for (int attempt = 0; attempt < casAttempts(); ++attempt) {
            auto current = store_->get(key);
            if (!current) {
                if (store_->compareAndSwap(key, std::nullopt, desired) ==
                    ports::output::CasResult::SWAPPED) {
                    return;
                }
                continue;
            }

            std::string currentId = records::decodeUsernameIndex(*current);
            if (currentId == session.sessionId) {
                return;
            }

            auto currentSession = findSession(currentId);
            if (currentSession && isNewer(*currentSession, session)) {
                return;
            }

            if (store_->compareAndSwap(key, *current, desired) == ports::output::CasResult::SWAPPED) {
                if (currentSession) {
                    store_->remove(records::sessionKey(currentId));
                    std::cout << "[AuthService] Previous session of " << session.localUsername
                              << " superseded" << std::endl;
                }
                return;
            }
        }

        throw domain::StoreUnavailableError("too much contention on username index");
    }
};

} // namespace jellyvr::application
