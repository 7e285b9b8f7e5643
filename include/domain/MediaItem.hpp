#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace jellyvr::domain {

struct MediaPerson {
    std::string name;
    std::string type;               ///< Actor, Director, Writer, ...
    std::string role;
};

struct MediaChapter {
    std::string name;
    int64_t startPositionTicks = 0;
};

struct MediaStream {
    int index = 0;
    std::string type;               ///< Video, Audio, Subtitle
    std::string codec;
    std::string language;
    std::string displayTitle;
    bool isTextSubtitleStream = false;
};

struct MediaSourceInfo {
    std::string id;
    std::string container;
    std::vector<MediaStream> streams;
};

/**
 * @brief Элемент библиотеки Jellyfin (BaseItemDto)
 *
 * Только поля, которые нужны для схемы HereSphere.
 * Все необязательные поля могут отсутствовать.
 */
struct MediaItem {
    std::string id;
    std::string name;
    std::string type;               ///< Movie, Episode, ...
    std::string locationType;       ///< FileSystem, Virtual, ...
    std::string overview;

    std::optional<std::string> seriesName;
    std::optional<std::string> seriesStudio;
    std::optional<std::string> seasonName;
    std::optional<int> indexNumber;         ///< Номер эпизода
    std::optional<int> parentIndexNumber;   ///< Номер сезона
    std::optional<int> productionYear;

    std::vector<std::string> studios;
    std::vector<std::string> genres;
    std::vector<std::string> tags;
    std::vector<MediaPerson> people;
    std::vector<MediaChapter> chapters;
    std::vector<MediaSourceInfo> mediaSources;

    std::optional<int64_t> runTimeTicks;
    std::optional<double> communityRating;  ///< 0..10
    std::optional<std::string> premiereDate;  ///< ISO 8601
    std::optional<std::string> dateCreated;   ///< ISO 8601
    bool isFavorite = false;

    bool isVirtual() const { return locationType == "Virtual"; }
    bool isEpisode() const { return type == "Episode"; }
    bool isMovie() const { return type == "Movie"; }
};

/**
 * @brief Результат PlaybackInfo: открытая в Jellyfin сессия воспроизведения
 */
struct PlaybackInfo {
    std::string playSessionId;
    std::string mediaSourceId;
    std::string transcodingUrl;     ///< Относительный URL или пусто
};

/**
 * @brief Учётные данные Jellyfin, передаются в каждый вызов
 */
struct JellyfinCredentials {
    std::string userId;
    std::string accessToken;
};

} // namespace jellyvr::domain
