#pragma once

#include "ports/input/IHereSphereService.hpp"
#include "ports/input/IAuthService.hpp"
#include "ports/input/IPlaybackTracker.hpp"
#include "ports/output/IJellyfinGateway.hpp"
#include "settings/IGatewaySettings.hpp"
#include "settings/IJellyfinSettings.hpp"
#include "application/HereSphereTranslator.hpp"
#include "application/RecordCodec.hpp"
#include "domain/Errors.hpp"
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <memory>
#include <iostream>
#include <vector>

namespace jellyvr::application {

/**
 * @brief API HereSphere поверх Jellyfin
 *
 * Каждый запрос HereSphere несёт логин/пароль, выданные на корневой странице.
 * Неверные данные или отозванный Jellyfin токен дают ответ access:-1,
 * на который плеер показывает форму логина. Сессия с отозванным токеном
 * удаляется, на корневой странице пользователь получает новый код.
 */
class HereSphereService : public ports::input::IHereSphereService {
public:
    HereSphereService(
        std::shared_ptr<ports::input::IAuthService> auth,
        std::shared_ptr<ports::input::IPlaybackTracker> tracker,
        std::shared_ptr<ports::output::IJellyfinGateway> jellyfin,
        std::shared_ptr<settings::IJellyfinSettings> jellyfinSettings,
        std::shared_ptr<settings::IGatewaySettings> settings
    ) : auth_(std::move(auth))
      , tracker_(std::move(tracker))
      , jellyfin_(std::move(jellyfin))
      , jellyfinSettings_(std::move(jellyfinSettings))
      , settings_(std::move(settings))
    {
        std::cout << "[HereSphereService] Created" << std::endl;
    }

    static nlohmann::json loginRequiredBody() {
        domain::heresphere::Library empty{"Login required", {}};
        return nlohmann::json{{"access", -1}, {"library", nlohmann::json::array({nlohmann::json(empty)})}};
    }

    ports::input::HereSphereResponse index(
        const domain::heresphere::Request& request,
        const std::string& host
    ) override {
        auto session = auth_->authenticateLocal(request.username, request.password);
        if (!session) {
            return loginRequired();
        }

        try {
            auto items = collectLibrary(*session);
            auto library = HereSphereTranslator::toLibrary("Library", host, items);
            return {200, nlohmann::json{{"access", 1}, {"library", nlohmann::json::array({nlohmann::json(library)})}}};
        } catch (const domain::AuthExpiredError& e) {
            std::cerr << "[HereSphereService] index: " << e.what() << std::endl;
            invalidate(*session);
            return loginRequired();
        }
    }

    ports::input::HereSphereResponse scan(
        const domain::heresphere::Request& request,
        const std::string& host
    ) override {
        auto session = auth_->authenticateLocal(request.username, request.password);
        if (!session) {
            return loginRequired();
        }

        try {
            auto items = collectLibrary(*session);
            auto ctx = context(*session, host);

            nlohmann::json scanData = nlohmann::json::array();
            for (const auto& item : items) {
                if (item.isVirtual()) {
                    continue;
                }
                try {
                    scanData.push_back(HereSphereTranslator::toScanEntry(item, ctx));
                } catch (const std::exception& e) {
                    std::cerr << "[HereSphereService] Skipping item " << item.id
                              << ": " << e.what() << std::endl;
                }
            }
            return {200, nlohmann::json{{"scanData", scanData}}};
        } catch (const domain::AuthExpiredError& e) {
            std::cerr << "[HereSphereService] scan: " << e.what() << std::endl;
            invalidate(*session);
            return loginRequired();
        }
    }

    ports::input::HereSphereResponse video(
        const domain::heresphere::Request& request,
        const std::string& host,
        const std::string& itemId
    ) override {
        auto session = auth_->authenticateLocal(request.username, request.password);
        if (!session) {
            return loginRequired();
        }

        try {
            domain::JellyfinCredentials credentials{session->jellyfinUserId, session->accessToken};
            auto item = jellyfin_->getItem(credentials, itemId);
            if (!item) {
                return {404, nlohmann::json{{"error", "Video not found"}}};
            }

            auto video = HereSphereTranslator::toVideoData(*item, context(*session, host));

            if (request.needsMediaSource.value_or(false)) {
                openPlayback(*session, host, itemId, video);
            }

            return {200, nlohmann::json(video)};
        } catch (const domain::AuthExpiredError& e) {
            std::cerr << "[HereSphereService] video: " << e.what() << std::endl;
            invalidate(*session);
            return loginRequired();
        }
    }

    ports::input::HereSphereResponse event(
        const std::string& sessionId,
        const std::string& itemId,
        const domain::heresphere::Event& event
    ) override {
        auto session = auth_->findSession(sessionId);
        if (!session) {
            return {404, nlohmann::json{{"error", "Unknown session"}}};
        }
        if (!event.username.empty() && event.username != session->localUsername) {
            std::cerr << "[HereSphereService] Event user does not match session " << sessionId << std::endl;
            return {403, nlohmann::json{{"error", "Session mismatch"}}};
        }

        if (event.event == domain::heresphere::EventType::OPEN) {
            return {200, nlohmann::json{{"status", "ignored"}}};
        }

        domain::PlaybackReport report;
        report.sessionId = sessionId;
        report.itemId = itemId;
        report.positionTicks = toInt64(event.time * HereSphereTranslator::TICKS_PER_MS, INT64_LIMIT, "time");
        report.reportedAt = event.utc == 0.0
            ? std::chrono::system_clock::now()
            : records::fromMillis(toInt64(event.utc, UTC_LIMIT_MS, "utc"));
        report.kind = event.event == domain::heresphere::EventType::CLOSE
            ? closeKind(*session, itemId, report.positionTicks)
            : domain::PlaybackEventKind::PROGRESS;

        auto outcome = tracker_->report(report);
        return {200, nlohmann::json{{"status", toString(outcome)}}};
    }

private:
    std::shared_ptr<ports::input::IAuthService> auth_;
    std::shared_ptr<ports::input::IPlaybackTracker> tracker_;
    std::shared_ptr<ports::output::IJellyfinGateway> jellyfin_;
    std::shared_ptr<settings::IJellyfinSettings> jellyfinSettings_;
    std::shared_ptr<settings::IGatewaySettings> settings_;

    static ports::input::HereSphereResponse loginRequired() {
        return {200, loginRequiredBody()};
    }

    /// 2^63: всё, что меньше, помещается в int64_t
    static constexpr double INT64_LIMIT = 9223372036854775808.0;
    /// 2100-01-01T00:00:00Z в мс
    static constexpr double UTC_LIMIT_MS = 4102444800000.0;

    /**
     * @brief Число из тела события в int64
     * @throws std::invalid_argument для NaN, бесконечности, отрицательных значений и value >= limit
     */
    static int64_t toInt64(double value, double limit, const char* field) {
        if (!std::isfinite(value) || value < 0.0 || value >= limit) {
            throw std::invalid_argument(std::string("Invalid event field: ") + field);
        }
        return static_cast<int64_t>(value);
    }

    /**
     * @brief Jellyfin отклонил токен: сессия больше не годится
     */
    void invalidate(const domain::Session& session) {
        try {
            auth_->invalidateSession(session.sessionId);
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[HereSphereService] Session " << session.sessionId
                      << " not invalidated: " << e.what() << std::endl;
        }
    }

    static std::string toString(ports::input::ReportOutcome outcome) {
        switch (outcome) {
            case ports::input::ReportOutcome::APPLIED: return "applied";
            case ports::input::ReportOutcome::DUPLICATE: return "duplicate";
            case ports::input::ReportOutcome::STALE: return "stale";
        }
        return "unknown";
    }

    TranslationContext context(const domain::Session& session, const std::string& host) const {
        TranslationContext ctx;
        ctx.gatewayHost = host;
        ctx.jellyfinBase = jellyfin_->baseUrl();
        ctx.jellyfinRemoteBase = jellyfinSettings_->getRemoteHost();
        ctx.accessToken = session.accessToken;
        ctx.subtitlesLanguage = settings_->getSubtitlesLanguage();
        return ctx;
    }

    std::vector<domain::MediaItem> collectLibrary(const domain::Session& session) {
        auto cursor = jellyfin_->listLibrary({session.jellyfinUserId, session.accessToken});
        std::vector<domain::MediaItem> items;
        while (auto page = cursor.next()) {
            items.insert(items.end(),
                         std::make_move_iterator(page->begin()),
                         std::make_move_iterator(page->end()));
        }
        return items;
    }

    /**
     * @brief Открыть сессию воспроизведения Jellyfin и направить плеер на HLS поток
     */
    void openPlayback(const domain::Session& session,
                      const std::string& host,
                      const std::string& itemId,
                      domain::heresphere::VideoData& video) {
        domain::JellyfinCredentials credentials{session.jellyfinUserId, session.accessToken};
        auto info = jellyfin_->getPlaybackInfo(credentials, itemId);
        std::string mediaSourceId = info.mediaSourceId.empty() ? itemId : info.mediaSourceId;

        std::string path = !info.transcodingUrl.empty()
            ? info.transcodingUrl
            : "/Videos/" + itemId + "/master.m3u8?playSessionId=" + info.playSessionId +
              "&api_key=" + session.accessToken + "&mediaSourceId=" + mediaSourceId;
        std::string url = jellyfin_->rewriteMediaUrl(jellyfin_->baseUrl() + path);

        if (video.media.empty()) {
            domain::heresphere::Media stream;
            stream.name = "stream";
            video.media.push_back(std::move(stream));
        }
        video.media.front().sources.assign(1, domain::heresphere::MediaSource{url});
        video.eventServer = HereSphereTranslator::eventServerUrl(host, session.sessionId, itemId);

        tracker_->registerPlaySession(session.sessionId, itemId, info.playSessionId, mediaSourceId);
    }

    /**
     * @brief STOP или WATCHED в зависимости от доли просмотренного
     *
     * Без длительности (или если Jellyfin недоступен) - STOP.
     */
    domain::PlaybackEventKind closeKind(const domain::Session& session,
                                        const std::string& itemId,
                                        int64_t positionTicks) {
        try {
            auto item = jellyfin_->getItem({session.jellyfinUserId, session.accessToken}, itemId);
            if (item && item->runTimeTicks && *item->runTimeTicks > 0) {
                int64_t threshold = *item->runTimeTicks / 100 * settings_->getWatchedPercent();
                if (positionTicks >= threshold) {
                    return domain::PlaybackEventKind::WATCHED;
                }
            }
        } catch (const domain::GatewayError& e) {
            std::cerr << "[HereSphereService] Runtime lookup failed for " << itemId
                      << ": " << e.what() << std::endl;
        }
        return domain::PlaybackEventKind::STOP;
    }
};

} // namespace jellyvr::application
