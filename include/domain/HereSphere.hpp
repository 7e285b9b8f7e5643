#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace jellyvr::domain::heresphere {

/// Заголовок, по которому HereSphere распознаёт API
inline const std::string MAGIC_HEADER = "HereSphere-JSON-Version";
inline const std::string MAGIC_VERSION = "1";

struct Tag {
    std::string name;               ///< "Category:Value"
    std::optional<double> start;    ///< мс
    std::optional<double> end;      ///< мс
    std::optional<int> track;
    std::optional<double> rating;

    bool operator==(const Tag& other) const {
        return name == other.name && start == other.start && end == other.end
            && track == other.track && rating == other.rating;
    }
};

struct MediaSource {
    std::string url;
};

struct Media {
    std::string name;
    std::vector<MediaSource> sources;
};

struct Subtitle {
    std::string name;
    std::string language;
    std::string url;
};

/**
 * @brief Детальная карточка видео (POST /heresphere/{id})
 */
struct VideoData {
    int access = 1;
    std::string title;
    std::string description;
    std::string thumbnailImage;
    std::string dateReleased;
    std::string dateAdded;
    double duration = 0.0;          ///< мс
    double rating = 0.0;            ///< 0..5
    bool isFavorite = false;
    std::string projection = "perspective";
    std::string stereo = "mono";
    std::optional<std::string> eventServer;
    std::vector<Subtitle> subtitles;
    std::vector<Tag> tags;
    std::vector<Media> media;
    bool writeHsp = false;
};

/**
 * @brief Запись для POST /heresphere/scan
 */
struct ScanEntry {
    std::string link;
    std::string title;
    std::string thumbnailImage;
    std::string dateReleased;
    std::string dateAdded;
    double duration = 0.0;
    double rating = 0.0;
    int favorites = 0;
    int comments = 0;
    bool isFavorite = false;
    std::vector<Tag> tags;
};

struct Library {
    std::string name;
    std::vector<std::string> list;
};

/**
 * @brief Тип события плеера (числовой в JSON)
 */
enum class EventType {
    OPEN = 0,
    PLAY = 1,
    PAUSE = 2,
    CLOSE = 3
};

/**
 * @brief Событие воспроизведения от HereSphere
 */
struct Event {
    std::string username;
    std::string id;
    std::string title;
    EventType event = EventType::OPEN;
    double time = 0.0;              ///< Позиция, мс
    double speed = 1.0;
    double utc = 0.0;               ///< UTC, мс
    std::string connectionKey;
};

/**
 * @brief Тело любого запроса HereSphere (логин + опции)
 */
struct Request {
    std::string username;
    std::string password;
    std::optional<bool> needsMediaSource;
};

// ============================================
// JSON
// ============================================

inline void to_json(nlohmann::json& j, const Tag& tag) {
    j = nlohmann::json{{"name", tag.name}};
    if (tag.start) j["start"] = *tag.start;
    if (tag.end) j["end"] = *tag.end;
    if (tag.track) j["track"] = *tag.track;
    if (tag.rating) j["rating"] = *tag.rating;
}

inline void to_json(nlohmann::json& j, const MediaSource& source) {
    j = nlohmann::json{{"url", source.url}};
}

inline void to_json(nlohmann::json& j, const Media& media) {
    j = nlohmann::json{{"name", media.name}, {"sources", media.sources}};
}

inline void to_json(nlohmann::json& j, const Subtitle& subtitle) {
    j = nlohmann::json{
        {"name", subtitle.name},
        {"language", subtitle.language},
        {"url", subtitle.url}
    };
}

inline void to_json(nlohmann::json& j, const VideoData& video) {
    j = nlohmann::json{
        {"access", video.access},
        {"title", video.title},
        {"description", video.description},
        {"thumbnailImage", video.thumbnailImage},
        {"dateReleased", video.dateReleased},
        {"dateAdded", video.dateAdded},
        {"duration", video.duration},
        {"rating", video.rating},
        {"isFavorite", video.isFavorite},
        {"projection", video.projection},
        {"stereo", video.stereo},
        {"subtitles", video.subtitles},
        {"tags", video.tags},
        {"media", video.media},
        {"writeHSP", video.writeHsp}
    };
    if (video.eventServer) {
        j["eventServer"] = *video.eventServer;
    }
}

inline void to_json(nlohmann::json& j, const ScanEntry& entry) {
    j = nlohmann::json{
        {"link", entry.link},
        {"title", entry.title},
        {"thumbnailImage", entry.thumbnailImage},
        {"dateReleased", entry.dateReleased},
        {"dateAdded", entry.dateAdded},
        {"duration", entry.duration},
        {"rating", entry.rating},
        {"favorites", entry.favorites},
        {"comments", entry.comments},
        {"isFavorite", entry.isFavorite},
        {"tags", entry.tags}
    };
}

inline void to_json(nlohmann::json& j, const Library& library) {
    j = nlohmann::json{{"name", library.name}, {"list", library.list}};
}

/**
 * @brief Разобрать событие плеера
 * @throws nlohmann::json::exception при неверном типе полей
 * @throws std::invalid_argument при неизвестном типе события
 */
inline Event parseEvent(const nlohmann::json& j) {
    Event event;
    event.username = j.value("username", "");
    event.id = j.value("id", "");
    event.title = j.value("title", "");
    int type = j.value("event", 0);
    if (type < 0 || type > 3) {
        throw std::invalid_argument("Unknown HereSphere event type: " + std::to_string(type));
    }
    event.event = static_cast<EventType>(type);
    event.time = j.value("time", 0.0);
    event.speed = j.value("speed", 1.0);
    event.utc = j.value("utc", 0.0);
    event.connectionKey = j.value("connectionKey", "");
    return event;
}

inline Request parseRequest(const nlohmann::json& j) {
    Request request;
    request.username = j.value("username", "");
    request.password = j.value("password", "");
    if (j.contains("needsMediaSource") && j["needsMediaSource"].is_boolean()) {
        request.needsMediaSource = j["needsMediaSource"].get<bool>();
    }
    return request;
}

} // namespace jellyvr::domain::heresphere
