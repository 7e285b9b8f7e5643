#pragma once

#include "domain/MediaItem.hpp"
#include <functional>
#include <vector>
#include <optional>

namespace jellyvr::ports::output {

/**
 * @brief Одна страница выдачи /Users/{id}/Items
 */
struct LibraryPage {
    std::vector<domain::MediaItem> items;
    int totalRecordCount = 0;
    int rawCount = 0;   ///< Сколько элементов вернул Jellyfin до фильтрации битых
};

/**
 * @brief Ленивая конечная последовательность страниц библиотеки
 *
 * Страница запрашивается только при вызове next().
 * Обход заканчивается, когда пройдено totalRecordCount элементов
 * или Jellyfin вернул пустую страницу.
 *
 * @example
 * ```cpp
 * auto cursor = gateway->listLibrary(credentials);
 * while (auto page = cursor.next()) {
 *     for (const auto& item : *page) { ... }
 * }
 * ```
 */
class LibraryCursor {
public:
    using PageFetcher = std::function<LibraryPage(int startIndex, int limit)>;

    LibraryCursor(PageFetcher fetcher, int pageSize)
        : fetcher_(std::move(fetcher))
        , pageSize_(pageSize > 0 ? pageSize : 100)
    {}

    std::optional<std::vector<domain::MediaItem>> next() {
        if (finished_) {
            return std::nullopt;
        }

        auto page = fetcher_(startIndex_, pageSize_);
        ++pagesFetched_;

        startIndex_ += page.rawCount;
        if (page.rawCount == 0 || startIndex_ >= page.totalRecordCount) {
            finished_ = true;
        }

        if (page.rawCount == 0) {
            return std::nullopt;
        }
        return std::move(page.items);
    }

    bool finished() const { return finished_; }
    int pagesFetched() const { return pagesFetched_; }

private:
    PageFetcher fetcher_;
    int pageSize_;
    int startIndex_ = 0;
    int pagesFetched_ = 0;
    bool finished_ = false;
};

} // namespace jellyvr::ports::output
