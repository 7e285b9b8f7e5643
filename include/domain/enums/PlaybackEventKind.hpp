#pragma once

#include <string>
#include <stdexcept>

namespace jellyvr::domain {

/**
 * @brief Тип события воспроизведения, пересылаемого в Jellyfin
 */
enum class PlaybackEventKind {
    PROGRESS,
    STOP,
    WATCHED
};

inline std::string toString(PlaybackEventKind kind) {
    switch (kind) {
        case PlaybackEventKind::PROGRESS: return "PROGRESS";
        case PlaybackEventKind::STOP: return "STOP";
        case PlaybackEventKind::WATCHED: return "WATCHED";
    }
    return "UNKNOWN";
}

inline PlaybackEventKind parsePlaybackEventKind(const std::string& str) {
    if (str == "PROGRESS") return PlaybackEventKind::PROGRESS;
    if (str == "STOP") return PlaybackEventKind::STOP;
    if (str == "WATCHED") return PlaybackEventKind::WATCHED;
    throw std::invalid_argument("Unknown playback event kind: " + str);
}

} // namespace jellyvr::domain
