#pragma once

#include "domain/MediaItem.hpp"
#include "domain/enums/PlaybackEventKind.hpp"
#include <string>
#include <cstdint>

namespace jellyvr::ports::output {

/**
 * @brief Задача пересылки события воспроизведения в Jellyfin
 */
struct RelayTask {
    enum class Type {
        START,
        PROGRESS
    };

    Type type = Type::PROGRESS;
    domain::JellyfinCredentials credentials;
    std::string itemId;
    int64_t positionTicks = 0;
    domain::PlaybackEventKind kind = domain::PlaybackEventKind::PROGRESS;
    std::string playSessionId;
    std::string mediaSourceId;
};

/**
 * @brief Пересылка событий в Jellyfin вне потока запроса
 *
 * Ошибки пересылки логируются и не возвращаются вызывающему.
 */
class IProgressRelay {
public:
    virtual ~IProgressRelay() = default;

    virtual void enqueue(RelayTask task) = 0;
};

} // namespace jellyvr::ports::output
