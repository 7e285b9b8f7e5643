#pragma once

#include "ports/input/IPlaybackTracker.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/IProgressRelay.hpp"
#include "settings/IGatewaySettings.hpp"
#include "application/RecordCodec.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <memory>
#include <iostream>
#include <stdexcept>
#include <tuple>

namespace jellyvr::application {

/**
 * @brief Приём отчётов о воспроизведении
 *
 * Состояние (session, item) обновляется CAS-циклом по правилу
 * last-writer-wins. Отчёты упорядочены полностью:
 * reportedAt, затем positionTicks, затем watched, затем тип события.
 * Итоговое состояние не зависит от порядка прихода отчётов.
 *
 * Применённые отчёты уходят в IProgressRelay, устаревшие и повторы нет.
 */
class PlaybackTracker : public ports::input::IPlaybackTracker {
public:
    PlaybackTracker(
        std::shared_ptr<ports::output::IKeyValueStore> store,
        std::shared_ptr<ports::output::IProgressRelay> relay,
        std::shared_ptr<settings::IGatewaySettings> settings
    ) : store_(std::move(store))
      , relay_(std::move(relay))
      , settings_(std::move(settings))
    {
        std::cout << "[PlaybackTracker] Created" << std::endl;
    }

    ports::input::ReportOutcome report(const domain::PlaybackReport& report) override {
        auto session = loadSession(report.sessionId);
        const std::string key = records::playbackKey(report.sessionId, report.itemId);

        for (int attempt = 0; attempt < casAttempts(); ++attempt) {
            auto raw = store_->get(key);

            domain::PlaybackState next;
            if (raw) {
                auto current = records::decodePlaybackState(*raw);
                auto incoming = orderKey(report);
                auto existing = orderKey(current);
                if (incoming == existing) {
                    return ports::input::ReportOutcome::DUPLICATE;
                }
                if (incoming < existing) {
                    return ports::input::ReportOutcome::STALE;
                }
                next = current;
            } else {
                next.sessionId = report.sessionId;
                next.itemId = report.itemId;
            }

            next.positionTicks = report.positionTicks;
            next.watched = report.kind == domain::PlaybackEventKind::WATCHED;
            next.lastEvent = report.kind;
            next.lastReportedAt = report.reportedAt;

            if (store_->compareAndSwap(key, raw, records::encode(next)) ==
                ports::output::CasResult::SWAPPED) {
                ports::output::RelayTask task;
                task.type = ports::output::RelayTask::Type::PROGRESS;
                task.credentials = {session.jellyfinUserId, session.accessToken};
                task.itemId = report.itemId;
                task.positionTicks = report.positionTicks;
                task.kind = report.kind;
                task.playSessionId = next.playSessionId;
                task.mediaSourceId = next.mediaSourceId;
                relay_->enqueue(std::move(task));
                return ports::input::ReportOutcome::APPLIED;
            }
        }

        throw domain::StoreUnavailableError("too much contention on playback record");
    }

    void registerPlaySession(
        const std::string& sessionId,
        const std::string& itemId,
        const std::string& playSessionId,
        const std::string& mediaSourceId
    ) override {
        auto session = loadSession(sessionId);
        const std::string key = records::playbackKey(sessionId, itemId);

        for (int attempt = 0; attempt < casAttempts(); ++attempt) {
            auto raw = store_->get(key);

            domain::PlaybackState next;
            if (raw) {
                next = records::decodePlaybackState(*raw);
            } else {
                next.sessionId = sessionId;
                next.itemId = itemId;
            }
            next.playSessionId = playSessionId;
            next.mediaSourceId = mediaSourceId;

            if (store_->compareAndSwap(key, raw, records::encode(next)) ==
                ports::output::CasResult::SWAPPED) {
                ports::output::RelayTask task;
                task.type = ports::output::RelayTask::Type::START;
                task.credentials = {session.jellyfinUserId, session.accessToken};
                task.itemId = itemId;
                task.positionTicks = next.positionTicks;
                task.playSessionId = playSessionId;
                task.mediaSourceId = mediaSourceId;
                relay_->enqueue(std::move(task));
                return;
            }
        }

        throw domain::StoreUnavailableError("too much contention on playback record");
    }

    std::optional<domain::PlaybackState> getState(
        const std::string& sessionId,
        const std::string& itemId
    ) override {
        auto raw = store_->get(records::playbackKey(sessionId, itemId));
        if (!raw) {
            return std::nullopt;
        }
        return records::decodePlaybackState(*raw);
    }

private:
    std::shared_ptr<ports::output::IKeyValueStore> store_;
    std::shared_ptr<ports::output::IProgressRelay> relay_;
    std::shared_ptr<settings::IGatewaySettings> settings_;

    using OrderKey = std::tuple<int64_t, int64_t, bool, int>;

    int casAttempts() const {
        return std::max(1, settings_->getStoreCasAttempts());
    }

    static int kindRank(domain::PlaybackEventKind kind) {
        switch (kind) {
            case domain::PlaybackEventKind::PROGRESS: return 0;
            case domain::PlaybackEventKind::STOP: return 1;
            case domain::PlaybackEventKind::WATCHED: return 2;
        }
        return 0;
    }

    static OrderKey orderKey(const domain::PlaybackReport& report) {
        return {records::toMillis(report.reportedAt), report.positionTicks,
                report.kind == domain::PlaybackEventKind::WATCHED, kindRank(report.kind)};
    }

    static OrderKey orderKey(const domain::PlaybackState& state) {
        return {records::toMillis(state.lastReportedAt), state.positionTicks,
                state.watched, kindRank(state.lastEvent)};
    }

    domain::Session loadSession(const std::string& sessionId) {
        auto raw = store_->get(records::sessionKey(sessionId));
        if (!raw) {
            throw std::invalid_argument("Unknown session: " + sessionId);
        }
        return records::decodeSession(*raw);
    }
};

} // namespace jellyvr::application
