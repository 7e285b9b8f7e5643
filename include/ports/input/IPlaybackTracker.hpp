#pragma once

#include "domain/PlaybackState.hpp"
#include <string>
#include <optional>

namespace jellyvr::ports::input {

/**
 * @brief Результат применения отчёта
 */
enum class ReportOutcome {
    APPLIED,
    DUPLICATE,  ///< Идентичный отчёт уже применён
    STALE       ///< Уже применён более поздний отчёт
};

/**
 * @brief Приём событий воспроизведения и пересылка в Jellyfin
 */
class IPlaybackTracker {
public:
    virtual ~IPlaybackTracker() = default;

    /**
     * @brief Upsert состояния (last-writer-wins) и пересылка в Jellyfin
     * @throws domain::StoreUnavailableError
     * @throws std::invalid_argument если сессия не найдена
     */
    virtual ReportOutcome report(const domain::PlaybackReport& report) = 0;

    /**
     * @brief Запомнить PlaySessionId открытого воспроизведения и сообщить старт
     */
    virtual void registerPlaySession(
        const std::string& sessionId,
        const std::string& itemId,
        const std::string& playSessionId,
        const std::string& mediaSourceId
    ) = 0;

    virtual std::optional<domain::PlaybackState> getState(
        const std::string& sessionId,
        const std::string& itemId
    ) = 0;
};

} // namespace jellyvr::ports::input
