#pragma once

#include "domain/enums/PlaybackEventKind.hpp"
#include <string>
#include <cstdint>
#include <chrono>

namespace jellyvr::domain {

/**
 * @brief Последнее известное состояние просмотра (session, item)
 *
 * Обновляется по правилу last-writer-wins по lastReportedAt.
 */
struct PlaybackState {
    std::string sessionId;
    std::string itemId;
    int64_t positionTicks = 0;      ///< 1 tick = 100 нс
    bool watched = false;
    PlaybackEventKind lastEvent = PlaybackEventKind::PROGRESS;
    std::string playSessionId;      ///< PlaySessionId из Jellyfin PlaybackInfo
    std::string mediaSourceId;
    std::chrono::system_clock::time_point lastReportedAt{};
};

/**
 * @brief Входящий отчёт о воспроизведении
 */
struct PlaybackReport {
    std::string sessionId;
    std::string itemId;
    int64_t positionTicks = 0;
    PlaybackEventKind kind = PlaybackEventKind::PROGRESS;
    std::chrono::system_clock::time_point reportedAt{};
};

} // namespace jellyvr::domain
