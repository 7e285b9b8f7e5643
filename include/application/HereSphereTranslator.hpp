#pragma once

#include "domain/MediaItem.hpp"
#include "domain/HereSphere.hpp"
#include "application/UrlRewriter.hpp"
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jellyvr::application {

/**
 * @brief Всё, что нужно для построения ссылок при переводе элемента
 */
struct TranslationContext {
    std::string gatewayHost;        ///< "https://vr.example.com", база ссылок /heresphere/...
    std::string jellyfinBase;       ///< Внутренний адрес Jellyfin
    std::string jellyfinRemoteBase; ///< Внешний адрес Jellyfin, может быть пустым
    std::string accessToken;        ///< api_key в ссылках на медиа
    std::string subtitlesLanguage;  ///< Пусто - все языки
};

/**
 * @brief Перевод элементов Jellyfin в схему HereSphere
 *
 * Только чистые функции: без I/O и без состояния.
 * Отсутствующие поля Jellyfin лишь сокращают список тегов.
 */
class HereSphereTranslator {
public:
    static constexpr double TICKS_PER_MS = 10000.0;

    /**
     * @brief Таблица псевдонимов категорий тегов
     *
     * Для каждого тега категории first дополнительно выпускается
     * тег категории second с тем же значением.
     */
    static const std::vector<std::pair<std::string, std::string>>& tagAliases() {
        static const std::vector<std::pair<std::string, std::string>> aliases = {
            {"Studio", "Series"},
        };
        return aliases;
    }

    static std::string videoLink(const std::string& gatewayHost, const std::string& itemId) {
        return gatewayHost + "/heresphere/" + itemId;
    }

    static std::string eventServerUrl(const std::string& gatewayHost,
                                      const std::string& sessionId,
                                      const std::string& itemId) {
        return gatewayHost + "/heresphere/events/" + sessionId + "/" + itemId;
    }

    /**
     * @brief Ссылки на видео для индекса; виртуальные элементы пропускаются
     */
    static domain::heresphere::Library toLibrary(const std::string& name,
                                                 const std::string& gatewayHost,
                                                 const std::vector<domain::MediaItem>& items) {
        domain::heresphere::Library library;
        library.name = name;
        for (const auto& item : items) {
            if (item.isVirtual()) {
                continue;
            }
            library.list.push_back(videoLink(gatewayHost, item.id));
        }
        return library;
    }

    static domain::heresphere::VideoData toVideoData(const domain::MediaItem& item,
                                                     const TranslationContext& ctx) {
        domain::heresphere::VideoData video;
        video.title = title(item);
        video.description = item.overview;
        video.thumbnailImage = thumbnailUrl(item, ctx);
        video.dateReleased = formatDate(item.premiereDate);
        video.dateAdded = formatDate(item.dateCreated);
        video.duration = durationMs(item);
        video.rating = rating(item);
        video.isFavorite = item.isFavorite;
        video.tags = tags(item);
        video.media = media(item, ctx);
        video.subtitles = subtitles(item, ctx);
        return video;
    }

    static domain::heresphere::ScanEntry toScanEntry(const domain::MediaItem& item,
                                                     const TranslationContext& ctx) {
        domain::heresphere::ScanEntry entry;
        entry.link = videoLink(ctx.gatewayHost, item.id);
        entry.title = title(item);
        entry.thumbnailImage = thumbnailUrl(item, ctx);
        entry.dateReleased = formatDate(item.premiereDate);
        entry.dateAdded = formatDate(item.dateCreated);
        entry.duration = durationMs(item);
        entry.rating = rating(item);
        entry.isFavorite = item.isFavorite;
        entry.tags = tags(item);
        return entry;
    }

    /**
     * @brief "SxxEyy - Name" для эпизодов, иначе имя
     */
    static std::string title(const domain::MediaItem& item) {
        if (!item.isEpisode()) {
            return item.name;
        }
        char prefix[32];
        std::snprintf(prefix, sizeof(prefix), "S%02dE%02d - ",
                      item.parentIndexNumber.value_or(0),
                      item.indexNumber.value_or(0));
        return prefix + item.name;
    }

    static double durationMs(const domain::MediaItem& item) {
        return static_cast<double>(item.runTimeTicks.value_or(0)) / TICKS_PER_MS;
    }

    /// 0..10 → 0..5
    static double rating(const domain::MediaItem& item) {
        return item.communityRating.value_or(0.0) / 2.0;
    }

    /**
     * @brief ISO 8601 → YYYY-MM-DD; без даты - начало эпохи
     */
    static std::string formatDate(const std::optional<std::string>& isoDate) {
        if (!isoDate || isoDate->size() < 10) {
            return "1970-01-01";
        }
        return isoDate->substr(0, 10);
    }

    static std::string thumbnailUrl(const domain::MediaItem& item, const TranslationContext& ctx) {
        std::string imageType = item.isMovie() ? "Backdrop" : "Primary";
        return rewrite(ctx, ctx.jellyfinBase + "/Items/" + item.id + "/Images/" + imageType +
                       "?maxHeight=300&maxWidth=300&quality=90&api_key=" + ctx.accessToken);
    }

    /**
     * @brief Одна запись media на каждый media source Jellyfin (прямое скачивание)
     */
    static std::vector<domain::heresphere::Media> media(const domain::MediaItem& item,
                                                        const TranslationContext& ctx) {
        std::vector<domain::heresphere::Media> result;
        for (const auto& source : item.mediaSources) {
            if (source.id.empty()) {
                continue;
            }
            domain::heresphere::Media entry;
            entry.name = source.container.empty() ? "video" : source.container;
            entry.sources.push_back({rewrite(ctx, ctx.jellyfinBase + "/Items/" + source.id +
                                             "/Download?api_key=" + ctx.accessToken)});
            result.push_back(std::move(entry));
        }
        return result;
    }

    /**
     * @brief Текстовые субтитры всех media source, с фильтром по языку
     */
    static std::vector<domain::heresphere::Subtitle> subtitles(const domain::MediaItem& item,
                                                               const TranslationContext& ctx) {
        std::vector<domain::heresphere::Subtitle> result;
        for (const auto& source : item.mediaSources) {
            for (const auto& stream : source.streams) {
                if (stream.type != "Subtitle" || !stream.isTextSubtitleStream) {
                    continue;
                }
                if (!ctx.subtitlesLanguage.empty() && stream.language != ctx.subtitlesLanguage) {
                    continue;
                }
                domain::heresphere::Subtitle subtitle;
                subtitle.language = stream.language;
                subtitle.name = stream.displayTitle.empty() ? stream.language : stream.displayTitle;
                subtitle.url = rewrite(ctx, ctx.jellyfinBase + "/Videos/" + item.id + "/" + source.id +
                                       "/Subtitles/" + std::to_string(stream.index) +
                                       "/Stream." + stream.codec + "?api_key=" + ctx.accessToken);
                result.push_back(std::move(subtitle));
            }
        }
        return result;
    }

    /**
     * @brief Теги "Категория:Значение"
     *
     * Порядок: главы, жанры, теги, тип, фильм, сериал, студии, сезон, год,
     * люди, затем псевдонимы из tagAliases(). Повторы имён не выпускаются.
     */
    static std::vector<domain::heresphere::Tag> tags(const domain::MediaItem& item) {
        std::vector<domain::heresphere::Tag> result;

        // Главы: конец главы - начало следующей или конец видео
        double runtimeMs = durationMs(item);
        for (size_t i = 0; i < item.chapters.size(); ++i) {
            const auto& chapter = item.chapters[i];
            domain::heresphere::Tag tag;
            tag.name = "Chapter:" + (chapter.name.empty() ? std::string("Unknown") : chapter.name);
            tag.start = static_cast<double>(chapter.startPositionTicks) / TICKS_PER_MS;
            tag.end = i + 1 < item.chapters.size()
                ? static_cast<double>(item.chapters[i + 1].startPositionTicks) / TICKS_PER_MS
                : runtimeMs;
            tag.track = 0;
            result.push_back(std::move(tag));
        }

        for (const auto& genre : item.genres) {
            addTag(result, "Genre", genre);
        }
        for (const auto& tag : item.tags) {
            addTag(result, "Tag", tag);
        }
        addTag(result, "Type", item.type);

        if (item.isMovie()) {
            addTag(result, "Movie", item.name);
        }
        if (item.seriesName) {
            addTag(result, "Series", *item.seriesName);
        }
        for (const auto& studio : item.studios) {
            addTag(result, "Studio", studio);
        }
        if (item.seriesStudio) {
            addTag(result, "Studio", *item.seriesStudio);
        }
        if (item.seasonName) {
            addTag(result, "Season", *item.seasonName);
        }
        if (item.productionYear) {
            addTag(result, "Year", std::to_string(*item.productionYear));
        }

        for (const auto& person : item.people) {
            if (person.name.empty() || person.type.empty()) {
                continue;
            }
            if (!person.role.empty()) {
                addTag(result, person.type, person.name + " (" + person.role + ")");
            }
            addTag(result, person.type, person.name);
        }

        applyAliases(result);
        return result;
    }

private:
    static std::string rewrite(const TranslationContext& ctx, const std::string& url) {
        return rewriteMediaUrl(url, ctx.jellyfinBase, ctx.jellyfinRemoteBase);
    }

    static bool contains(const std::vector<domain::heresphere::Tag>& tags, const std::string& name) {
        for (const auto& tag : tags) {
            if (tag.name == name) {
                return true;
            }
        }
        return false;
    }

    static void addTag(std::vector<domain::heresphere::Tag>& tags,
                       const std::string& category,
                       const std::string& value) {
        if (category.empty() || value.empty()) {
            return;
        }
        std::string name = category + ":" + value;
        if (contains(tags, name)) {
            return;
        }
        domain::heresphere::Tag tag;
        tag.name = std::move(name);
        tags.push_back(std::move(tag));
    }

    static void applyAliases(std::vector<domain::heresphere::Tag>& tags) {
        size_t originalCount = tags.size();
        for (const auto& [from, to] : tagAliases()) {
            std::string prefix = from + ":";
            for (size_t i = 0; i < originalCount; ++i) {
                std::string name = tags[i].name;
                if (name.compare(0, prefix.size(), prefix) == 0) {
                    addTag(tags, to, name.substr(prefix.size()));
                }
            }
        }
    }
};

} // namespace jellyvr::application
